#pragma once
#include <string>
#include <string_view>
#include <chrono>
#include <ctime>
#include <cctype>
#include <algorithm>
#include <fmt/format.h>
#include <fmt/chrono.h>

namespace crossforge {

// Formats `tp` in UTC following a Go reference-time layout
// ("Mon Jan 2 15:04:05 MST 2006"), e.g. "20060102" -> "20261018".
inline std::string format_go_time(const std::string_view layout, const std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;

    static constexpr std::string_view long_months[] = {
        "January", "February", "March", "April", "May", "June",
        "July", "August", "September", "October", "November", "December"};
    static constexpr std::string_view long_days[] = {
        "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};

    const std::tm tm = fmt::gmtime(system_clock::to_time_t(tp));
    const auto nanos = duration_cast<nanoseconds>(tp.time_since_epoch() - floor<seconds>(tp.time_since_epoch())).count();
    const int hour12 = tm.tm_hour % 12 == 0 ? 12 : tm.tm_hour % 12;

    std::string out;
    size_t i = 0;
    auto at = [&](const std::string_view token) { return layout.substr(i).starts_with(token); };
    auto take = [&](const std::string_view token, const std::string& value) {
        out += value;
        i += token.size();
    };

    while (i < layout.size()) {
        const char c = layout[i];
        switch (c) {
            case 'J':
                if (at("January")) { take("January", std::string(long_months[tm.tm_mon])); continue; }
                if (at("Jan")) { take("Jan", std::string(long_months[tm.tm_mon].substr(0, 3))); continue; }
                break;
            case 'M':
                if (at("Monday")) { take("Monday", std::string(long_days[tm.tm_wday])); continue; }
                if (at("Mon")) { take("Mon", std::string(long_days[tm.tm_wday].substr(0, 3))); continue; }
                if (at("MST")) { take("MST", "UTC"); continue; }
                break;
            case '0':
                if (i + 1 < layout.size() && layout[i + 1] >= '1' && layout[i + 1] <= '6') {
                    switch (layout[i + 1]) {
                        case '1': take("01", fmt::format("{:02}", tm.tm_mon + 1)); break;
                        case '2': take("02", fmt::format("{:02}", tm.tm_mday)); break;
                        case '3': take("03", fmt::format("{:02}", hour12)); break;
                        case '4': take("04", fmt::format("{:02}", tm.tm_min)); break;
                        case '5': take("05", fmt::format("{:02}", tm.tm_sec)); break;
                        default: take("06", fmt::format("{:02}", (tm.tm_year + 1900) % 100)); break;
                    }
                    continue;
                }
                if (at("002")) { take("002", fmt::format("{:03}", tm.tm_yday + 1)); continue; }
                break;
            case '1':
                if (at("15")) { take("15", fmt::format("{:02}", tm.tm_hour)); continue; }
                take("1", std::to_string(tm.tm_mon + 1));
                continue;
            case '2':
                if (at("2006")) { take("2006", fmt::format("{:04}", tm.tm_year + 1900)); continue; }
                take("2", std::to_string(tm.tm_mday));
                continue;
            case '_':
                if (at("_2") && !at("_2006")) { take("_2", fmt::format("{:>2}", tm.tm_mday)); continue; }
                if (at("__2")) { take("__2", fmt::format("{:>3}", tm.tm_yday + 1)); continue; }
                break;
            case '3': take("3", std::to_string(hour12)); continue;
            case '4': take("4", std::to_string(tm.tm_min)); continue;
            case '5': take("5", std::to_string(tm.tm_sec)); continue;
            case 'P':
                if (at("PM")) { take("PM", tm.tm_hour >= 12 ? "PM" : "AM"); continue; }
                break;
            case 'p':
                if (at("pm")) { take("pm", tm.tm_hour >= 12 ? "pm" : "am"); continue; }
                break;
            case '-':
                if (at("-070000")) { take("-070000", "+000000"); continue; }
                if (at("-07:00:00")) { take("-07:00:00", "+00:00:00"); continue; }
                if (at("-0700")) { take("-0700", "+0000"); continue; }
                if (at("-07:00")) { take("-07:00", "+00:00"); continue; }
                if (at("-07")) { take("-07", "+00"); continue; }
                break;
            case 'Z': {
                bool matched = false;
                for (const std::string_view zone : {"Z070000", "Z07:00:00", "Z0700", "Z07:00", "Z07"}) {
                    if (at(zone)) {
                        take(zone, "Z"); // always UTC
                        matched = true;
                        break;
                    }
                }
                if (matched) continue;
                break;
            }
            case '.':
            case ',':
                if (i + 1 < layout.size() && (layout[i + 1] == '0' || layout[i + 1] == '9')) {
                    const char digit = layout[i + 1];
                    size_t j = i + 1;
                    while (j < layout.size() && layout[j] == digit) ++j;
                    if (j < layout.size() && std::isdigit(static_cast<unsigned char>(layout[j]))) break;
                    const size_t width = std::min<size_t>(j - i - 1, 9);
                    std::string frac = fmt::format("{:09}", nanos).substr(0, width);
                    if (digit == '9') {
                        while (!frac.empty() && frac.back() == '0') frac.pop_back();
                    }
                    if (!frac.empty()) {
                        out += c;
                        out += frac;
                    }
                    i = j;
                    continue;
                }
                break;
            default:
                break;
        }
        out += c;
        ++i;
    }
    return out;
}

// RFC 3339 in UTC, the format of the template `Date` field
inline std::string format_rfc3339(const std::chrono::system_clock::time_point tp) {
    return format_go_time("2006-01-02T15:04:05Z07:00", tp);
}

} // namespace crossforge
