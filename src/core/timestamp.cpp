/**
 * @file timestamp.cpp
 * @brief ISO 8601 conversion for commit timestamps
 */

#include <ehr/core/timestamp.hpp>

#include <ehr/compat/time.hpp>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ehr::core {

namespace {

auto is_digits(std::string_view text) -> bool {
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return !text.empty();
}

auto to_int(std::string_view text) -> int {
    int value = 0;
    for (char c : text) {
        value = value * 10 + (c - '0');
    }
    return value;
}

}  // namespace

auto to_iso8601(timestamp tp) -> std::string {
    auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
    auto fraction = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - seconds);

    auto time_val = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(seconds));
    std::tm tm_val{};
    compat::gmtime_safe(&time_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");

    if (fraction.count() != 0) {
        std::ostringstream digits;
        digits << std::setfill('0') << std::setw(9) << fraction.count();
        auto text = digits.str();
        while (!text.empty() && text.back() == '0') {
            text.pop_back();
        }
        oss << '.' << text;
    }
    oss << 'Z';
    return oss.str();
}

auto parse_iso8601(std::string_view text) -> std::optional<timestamp> {
    // YYYY-MM-DDThh:mm:ss is 19 characters, plus the trailing 'Z'
    if (text.size() < 20 || text.back() != 'Z') {
        return std::nullopt;
    }
    if (text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    auto year = text.substr(0, 4);
    auto month = text.substr(5, 2);
    auto day = text.substr(8, 2);
    auto hour = text.substr(11, 2);
    auto minute = text.substr(14, 2);
    auto second = text.substr(17, 2);
    if (!is_digits(year) || !is_digits(month) || !is_digits(day) ||
        !is_digits(hour) || !is_digits(minute) || !is_digits(second)) {
        return std::nullopt;
    }

    auto rest = text.substr(19, text.size() - 20);
    std::chrono::nanoseconds fraction{0};
    if (!rest.empty()) {
        if (rest.front() != '.') {
            return std::nullopt;
        }
        auto digits = rest.substr(1);
        if (digits.size() > 9 || !is_digits(digits)) {
            return std::nullopt;
        }
        std::string padded{digits};
        padded.append(9 - digits.size(), '0');
        fraction = std::chrono::nanoseconds{std::stoll(padded)};
    }

    std::chrono::year_month_day ymd{
        std::chrono::year{to_int(year)},
        std::chrono::month{static_cast<unsigned>(to_int(month))},
        std::chrono::day{static_cast<unsigned>(to_int(day))}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    auto h = to_int(hour);
    auto m = to_int(minute);
    auto s = to_int(second);
    if (h > 23 || m > 59 || s > 59) {
        return std::nullopt;
    }

    auto point = std::chrono::sys_days{ymd} + std::chrono::hours{h} +
                 std::chrono::minutes{m} + std::chrono::seconds{s} + fraction;
    return std::chrono::time_point_cast<timestamp::duration>(point);
}

}  // namespace ehr::core
