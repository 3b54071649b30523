#pragma once

#include <exception>
#include <string>

namespace quarry {

/// Indicates that an input value (a date string, a resolution name, a field term) cannot be
/// converted to the requested type.
///
/// The message contains the offending value for more informative logging.
class InvalidFormat: public std::exception {
  public:
    explicit InvalidFormat(std::string message);
    [[nodiscard]] auto what() const noexcept -> char const* override;

  private:
    std::string m_message;
};

}  // namespace quarry
