#include <utility>

#include "quarry/error.hpp"

namespace quarry {

InvalidFormat::InvalidFormat(std::string message) : m_message(std::move(message)) {}

auto InvalidFormat::what() const noexcept -> char const* {
    return m_message.c_str();
}

}  // namespace quarry
