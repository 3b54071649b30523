#include "app.hpp"
#include "quarry/configuration.hpp"

namespace quarry::arg {

Collection::Collection(CLI::App* app) {
    app->add_option("-c,--collection", m_collection_path, "Collection file, one document per line")
        ->required();
    app->add_option("-f,--fields", m_fields, "Names of the tab-separated fields")->required();
}

auto Collection::collection_path() const -> std::string const& {
    return m_collection_path;
}

auto Collection::fields() const -> std::vector<std::string> const& {
    return m_fields;
}

Queries::Queries(CLI::App* app) : m_k(configuration::get().top_k) {
    app->add_option("-q,--queries", m_query_file, "Path to file with queries");
    app->add_option("-k", m_k, "The number of top results to return")->capture_default_str();
}

auto Queries::query_file() const -> std::optional<std::string> const& {
    return m_query_file;
}

auto Queries::k() const -> std::size_t {
    return m_k;
}

TieBreaker::TieBreaker(CLI::App* app) : m_tie_breaker(configuration::get().tie_breaker) {
    app->add_option(
           "-t,--tie-breaker",
           m_tie_breaker,
           "Weight of the scores of matching fields other than the best one"
    )
        ->capture_default_str();
}

auto TieBreaker::tie_breaker() const -> float {
    return m_tie_breaker;
}

LogLevel::LogLevel(CLI::App* app) {
    app->add_option("-L,--log-level", m_level, "Log level")
        ->capture_default_str()
        ->check(CLI::IsMember(VALID_LEVELS));
}

auto LogLevel::log_level() const -> spdlog::level::level_enum {
    return ENUM_MAP.at(m_level);
}

const std::set<std::string> LogLevel::VALID_LEVELS = {
    "trace", "debug", "info", "warn", "err", "critical", "off"
};
const std::map<std::string, spdlog::level::level_enum> LogLevel::ENUM_MAP = {
    {"trace", spdlog::level::level_enum::trace},
    {"debug", spdlog::level::level_enum::debug},
    {"info", spdlog::level::level_enum::info},
    {"warn", spdlog::level::level_enum::warn},
    {"err", spdlog::level::level_enum::err},
    {"critical", spdlog::level::level_enum::critical},
    {"off", spdlog::level::level_enum::off}
};

}  // namespace quarry::arg

namespace quarry {

auto add_resolution_option(CLI::App* app, std::string& resolution) -> CLI::Option* {
    resolution = configuration::get().date_resolution;
    return app->add_option("-r,--resolution", resolution, "Date resolution")
        ->capture_default_str()
        ->check(CLI::IsMember(std::vector<std::string>{
            "year", "month", "day", "hour", "minute", "second", "millisecond"
        }));
}

}  // namespace quarry
