#pragma once

#include <cstdlib>
#include <cstddef>
#include <cstring>
#include <string>

#include "boost/lexical_cast.hpp"

namespace quarry {

/// Process-wide defaults read from `QUARRY_*` environment variables.
class configuration {
  public:
    static configuration const& get()
    {
        static configuration instance;
        return instance;
    }

    /// Reads the environment again, bypassing the shared instance.
    static configuration load() { return configuration{}; }

    float tie_breaker{0.0F};
    std::size_t top_k{10};
    std::string date_resolution{"day"};

  private:
    configuration()
    {
        fillvar("QUARRY_TIE_BREAKER", tie_breaker);
        fillvar("QUARRY_TOP_K", top_k);
        fillvar("QUARRY_DATE_RESOLUTION", date_resolution);
    }

    template <typename T>
    void fillvar(const char* envvar, T& var)
    {
        const char* val = std::getenv(envvar);
        if (val && std::strlen(val)) {
            var = boost::lexical_cast<T>(val);
        }
    }
};

}  // namespace quarry
