#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

namespace quarry {

namespace arg {

    /// Tab-separated collection file and the names of its fields.
    struct Collection {
        explicit Collection(CLI::App* app);
        [[nodiscard]] auto collection_path() const -> std::string const&;
        [[nodiscard]] auto fields() const -> std::vector<std::string> const&;

      private:
        std::string m_collection_path;
        std::vector<std::string> m_fields;
    };

    /// Query file, or standard input if none is given, and the number of results per query.
    struct Queries {
        explicit Queries(CLI::App* app);
        [[nodiscard]] auto query_file() const -> std::optional<std::string> const&;
        [[nodiscard]] auto k() const -> std::size_t;

      private:
        std::optional<std::string> m_query_file;
        std::size_t m_k;
    };

    struct TieBreaker {
        explicit TieBreaker(CLI::App* app);
        [[nodiscard]] auto tie_breaker() const -> float;

      private:
        float m_tie_breaker;
    };

    /**
     * Log level configuration.
     *
     * This option takes one of the valid string values and translates it into spdlog log level
     * values.
     */
    struct LogLevel {
        static const std::set<std::string> VALID_LEVELS;
        static const std::map<std::string, spdlog::level::level_enum> ENUM_MAP;

        explicit LogLevel(CLI::App* app);
        [[nodiscard]] auto log_level() const -> spdlog::level::level_enum;

      private:
        std::string m_level = "info";
    };

}  // namespace arg

/**
 * A declarative way to define CLI interface. This class inherits from `CLI::App` and therefore it
 * can be used like a regular `CLI::App` object once it is defined. This way, we can have a
 * declarative base with the ability to customize it.
 */
template <typename... Args>
struct App: public CLI::App, public Args... {
    explicit App(std::string const& description) : CLI::App(description), Args(this)...
    {
        this->set_config("--config", "", "Configuration .ini file", false);
    }
};

/// Adds a `-r,--resolution` option to `app`, defaulting to the configured date resolution.
auto add_resolution_option(CLI::App* app, std::string& resolution) -> CLI::Option*;

}  // namespace quarry
