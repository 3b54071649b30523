#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <utility>

#include <fmt/format.h>

#include "quarry/document/date_tools.hpp"
#include "quarry/error.hpp"

namespace quarry {

namespace {

    struct ResolutionInfo {
        Resolution resolution;
        std::string_view name;
        std::size_t length;
    };

    constexpr std::array<ResolutionInfo, 7> RESOLUTIONS{{
        {Resolution::Year, "year", 4},
        {Resolution::Month, "month", 6},
        {Resolution::Day, "day", 8},
        {Resolution::Hour, "hour", 10},
        {Resolution::Minute, "minute", 12},
        {Resolution::Second, "second", 14},
        {Resolution::Millisecond, "millisecond", 17},
    }};

    [[nodiscard]] auto info(Resolution resolution) -> ResolutionInfo const& {
        auto pos = std::find_if(RESOLUTIONS.begin(), RESOLUTIONS.end(), [&](auto const& r) {
            return r.resolution == resolution;
        });
        if (pos == RESOLUTIONS.end()) {
            throw InvalidFormat(
                fmt::format("unknown resolution {}", static_cast<int>(resolution))
            );
        }
        return *pos;
    }

    /// Reads the decimal number in `value[first, first + len)`, which must consist of digits.
    [[nodiscard]] auto field(std::string_view value, std::size_t first, std::size_t len) -> int {
        int result = 0;
        auto digits = value.substr(first, len);
        std::from_chars(digits.data(), digits.data() + digits.size(), result);
        return result;
    }

}  // namespace

auto to_string(Resolution resolution) -> std::string_view {
    return info(resolution).name;
}

auto parse_resolution(std::string_view name) -> Resolution {
    auto pos = std::find_if(RESOLUTIONS.begin(), RESOLUTIONS.end(), [&](auto const& r) {
        return r.name == name;
    });
    if (pos == RESOLUTIONS.end()) {
        throw InvalidFormat(fmt::format("unknown resolution: {}", name));
    }
    return pos->resolution;
}

auto round(Timestamp time, Resolution resolution) -> Timestamp {
    using namespace std::chrono;
    auto day = floor<days>(time);
    year_month_day date{day};
    switch (resolution) {
    case Resolution::Year: return sys_days{date.year() / January / 1};
    case Resolution::Month: return sys_days{date.year() / date.month() / 1};
    case Resolution::Day: return day;
    case Resolution::Hour: return floor<hours>(time);
    case Resolution::Minute: return floor<minutes>(time);
    case Resolution::Second: return floor<seconds>(time);
    case Resolution::Millisecond: return time;
    }
    throw InvalidFormat(fmt::format("unknown resolution {}", static_cast<int>(resolution)));
}

auto round(std::int64_t millis, Resolution resolution) -> std::int64_t {
    return round(Timestamp{std::chrono::milliseconds{millis}}, resolution)
        .time_since_epoch()
        .count();
}

auto date_to_string(Timestamp time, Resolution resolution) -> std::string {
    using namespace std::chrono;
    auto const length = info(resolution).length;
    auto rounded = round(time, resolution);
    auto day = floor<days>(rounded);
    year_month_day date{day};
    if (date.year() < year{0} || date.year() > year{9999}) {
        throw InvalidFormat(fmt::format(
            "year {} cannot be written as a date string", static_cast<int>(date.year())
        ));
    }
    hh_mm_ss clock{rounded - day};
    auto full = fmt::format(
        "{:04}{:02}{:02}{:02}{:02}{:02}{:03}",
        static_cast<int>(date.year()),
        static_cast<unsigned>(date.month()),
        static_cast<unsigned>(date.day()),
        clock.hours().count(),
        clock.minutes().count(),
        clock.seconds().count(),
        clock.subseconds().count()
    );
    return full.substr(0, length);
}

auto time_to_string(std::int64_t millis, Resolution resolution) -> std::string {
    return date_to_string(Timestamp{std::chrono::milliseconds{millis}}, resolution);
}

auto string_to_date(std::string_view value) -> Timestamp {
    using namespace std::chrono;
    auto known_length = std::any_of(RESOLUTIONS.begin(), RESOLUTIONS.end(), [&](auto const& r) {
        return r.length == value.size();
    });
    auto all_digits = std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
    if (not known_length || not all_digits) {
        throw InvalidFormat(fmt::format("Input is not valid date string: {}", value));
    }
    auto part = [&](std::size_t first, std::size_t len, int absent) {
        return value.size() >= first + len ? field(value, first, len) : absent;
    };
    year_month_day date{
        year{part(0, 4, 1970)},
        month{static_cast<unsigned>(part(4, 2, 1))},
        day{static_cast<unsigned>(part(6, 2, 1))}};
    auto hour = part(8, 2, 0);
    auto minute = part(10, 2, 0);
    auto second = part(12, 2, 0);
    auto millisecond = part(14, 3, 0);
    if (not date.ok() || hour > 23 || minute > 59 || second > 59) {
        throw InvalidFormat(fmt::format("Input is not valid date string: {}", value));
    }
    return sys_days{date} + hours{hour} + minutes{minute} + seconds{second}
        + milliseconds{millisecond};
}

auto string_to_time(std::string_view value) -> std::int64_t {
    return string_to_date(value).time_since_epoch().count();
}

}  // namespace quarry
