#include <fstream>
#include <iostream>
#include <string>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "app.hpp"
#include "quarry/collection.hpp"
#include "quarry/error.hpp"
#include "quarry/search.hpp"

using namespace quarry;

int main(int argc, char** argv)
{
    spdlog::drop("");
    spdlog::set_default_logger(spdlog::stderr_color_mt(""));

    App<arg::Collection, arg::Queries, arg::TieBreaker, arg::LogLevel> app{
        "Searches a tab-separated collection with multi-field disjunction max queries."
    };
    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(app.log_level());

    try {
        std::ifstream collection(app.collection_path());
        if (not collection) {
            spdlog::error("Cannot open collection file: {}", app.collection_path());
            return 1;
        }
        auto index = read_collection(collection, app.fields());

        std::size_t query_idx = 0;
        auto run = [&](TextQuery text_query) {
            auto qid = text_query.id.value_or(std::to_string(query_idx++));
            auto query = multi_field_query(text_query.terms, app.fields(), app.tie_breaker());
            auto results = search(index, query, app.k());
            for (std::size_t rank = 0; rank < results.size(); ++rank) {
                std::cout << fmt::format(
                    "{}\t{}\t{}\t{}\n", qid, results[rank].second, rank, results[rank].first
                );
            }
        };
        if (app.query_file()) {
            std::ifstream is(*app.query_file());
            if (not is) {
                spdlog::error("Cannot open query file: {}", *app.query_file());
                return 1;
            }
            for_each_query(is, run);
        } else {
            for_each_query(std::cin, run);
        }
    } catch (InvalidFormat const& err) {
        spdlog::error("{}", err.what());
        return 1;
    }
    return 0;
}
