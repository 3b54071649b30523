#include <cstdint>
#include <iostream>
#include <string>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "app.hpp"
#include "quarry/document/date_tools.hpp"
#include "quarry/error.hpp"

using namespace quarry;

int main(int argc, char** argv)
{
    spdlog::drop("");
    spdlog::set_default_logger(spdlog::stderr_color_mt(""));

    std::int64_t millis = 0;
    std::string resolution;
    std::string value;

    App<arg::LogLevel> app{"Converts between dates and their sortable string form"};
    app.require_subcommand(1);
    auto* format = app.add_subcommand("format", "Prints the string form of a date");
    format->add_option("--millis", millis, "Milliseconds since the Unix epoch")->required();
    add_resolution_option(format, resolution);
    auto* parse = app.add_subcommand("parse", "Prints the milliseconds of a date string");
    parse->add_option("--value", value, "Date string, e.g., 20040921")->required();
    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(app.log_level());

    try {
        if (*format) {
            std::cout << time_to_string(millis, parse_resolution(resolution)) << '\n';
        } else {
            std::cout << string_to_time(value) << '\n';
        }
    } catch (InvalidFormat const& err) {
        spdlog::error("{}", err.what());
        return 1;
    }
    return 0;
}
