/**
 * @file timestamp.cpp
 * @brief Implementation of timestamp parsing and formatting helpers
 */

#include <blobtier/core/timestamp.hpp>

#include <blobtier/compat/time.hpp>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace blobtier {

namespace {

/**
 * @brief Convert broken-down UTC time to a time point
 *
 * Rejects values that std::timegm normalises into a different date
 * (e.g. February 30th).
 */
auto to_time_point(std::tm tm) -> std::optional<timestamp> {
    const std::tm requested = tm;
    auto seconds = compat::timegm_safe(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    if (tm.tm_year != requested.tm_year || tm.tm_mon != requested.tm_mon ||
        tm.tm_mday != requested.tm_mday || tm.tm_hour != requested.tm_hour ||
        tm.tm_min != requested.tm_min || tm.tm_sec != requested.tm_sec) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

auto break_down(timestamp tp, std::tm& tm) -> bool {
    auto seconds = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::seconds>(tp));
    return compat::gmtime_safe(&seconds, &tm) != nullptr;
}

}  // namespace

auto parse_rfc1123(std::string_view text) -> std::optional<timestamp> {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream stream{std::string(text)};
    stream.imbue(std::locale::classic());
    stream >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (stream.fail()) {
        return std::nullopt;
    }

    std::string zone;
    stream >> zone;
    if (!zone.empty() && zone != "GMT" && zone != "UTC") {
        return std::nullopt;
    }
    std::string trailing;
    if (stream >> trailing) {
        return std::nullopt;
    }
    return to_time_point(tm);
}

auto parse_iso8601(std::string_view text) -> std::optional<timestamp> {
    text = trim(text);
    if (text.size() < 10) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream date_stream{std::string(text.substr(0, 10))};
    date_stream.imbue(std::locale::classic());
    date_stream >> std::get_time(&tm, "%Y-%m-%d");
    if (date_stream.fail()) {
        return std::nullopt;
    }
    text.remove_prefix(10);

    std::chrono::nanoseconds fraction{0};
    if (!text.empty()) {
        if (text.front() != 'T' && text.front() != ' ') {
            return std::nullopt;
        }
        text.remove_prefix(1);
        if (text.size() < 8) {
            return std::nullopt;
        }

        std::istringstream time_stream{std::string(text.substr(0, 8))};
        time_stream.imbue(std::locale::classic());
        time_stream >> std::get_time(&tm, "%H:%M:%S");
        if (time_stream.fail()) {
            return std::nullopt;
        }
        text.remove_prefix(8);

        if (!text.empty() && text.front() == '.') {
            text.remove_prefix(1);
            std::int64_t value = 0;
            int digits = 0;
            while (!text.empty() && std::isdigit(static_cast<unsigned char>(text.front()))) {
                if (digits < 9) {
                    value = value * 10 + (text.front() - '0');
                    ++digits;
                }
                text.remove_prefix(1);
            }
            if (digits == 0) {
                return std::nullopt;
            }
            for (; digits < 9; ++digits) {
                value *= 10;
            }
            fraction = std::chrono::nanoseconds{value};
        }

        if (text == "Z" || text == "+00:00") {
            text = {};
        }
        if (!text.empty()) {
            return std::nullopt;
        }
    }

    auto base = to_time_point(tm);
    if (!base.has_value()) {
        return std::nullopt;
    }
    return *base + std::chrono::duration_cast<timestamp::duration>(fraction);
}

auto parse_timestamp(std::string_view text) -> std::optional<timestamp> {
    auto trimmed = trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    if (std::isdigit(static_cast<unsigned char>(trimmed.front()))) {
        return parse_iso8601(trimmed);
    }
    return parse_rfc1123(trimmed);
}

auto format_iso8601(timestamp tp) -> std::string {
    std::tm tm{};
    if (!break_down(tp, tm)) {
        return {};
    }
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

auto format_rfc1123(timestamp tp) -> std::string {
    std::tm tm{};
    if (!break_down(tp, tm)) {
        return {};
    }
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
    return oss.str();
}

auto format_file_stamp(timestamp tp) -> std::string {
    std::tm tm{};
    if (!break_down(tp, tm)) {
        return {};
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds{1000};
    }

    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, "%Y%m%dT%H%M%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace blobtier
