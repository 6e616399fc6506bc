/**
 * StringUtils.cpp
 *
 * String manipulation and formatting utilities.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fetchkit::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

// -- Formatting --

std::string StringUtils::formatBytes(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) { size /= 1024.0; ++unit; }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::formatSpeed(double bytesPerSecond) {
    if (bytesPerSecond < 0.0 || !std::isfinite(bytesPerSecond)) bytesPerSecond = 0.0;
    return formatBytes(static_cast<int64_t>(bytesPerSecond)) + "/s";
}

std::string StringUtils::formatEta(std::optional<double> seconds) {
    if (!seconds || *seconds < 0.0 || !std::isfinite(*seconds)) {
        return "unknown";
    }

    auto total = static_cast<int64_t>(*seconds);
    if (total < 60) {
        return std::to_string(total) + "s";
    }
    if (total < 3600) {
        return std::to_string(total / 60) + "m " + std::to_string(total % 60) + "s";
    }
    return std::to_string(total / 3600) + "h " + std::to_string((total % 3600) / 60) + "m";
}

std::string StringUtils::formatTimestamp(std::chrono::system_clock::time_point time, const std::string& format) {
    auto tt = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
}

std::string StringUtils::formatPercentage(double percent, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << percent << "%";
    return oss.str();
}

// -- Parsing --

int StringUtils::parseInt(const std::string& str, int defaultValue) {
    try { return std::stoi(str); } catch (const std::logic_error&) { return defaultValue; }
}

int64_t StringUtils::parseLong(const std::string& str, int64_t defaultValue) {
    try { return std::stoll(str); } catch (const std::logic_error&) { return defaultValue; }
}

std::optional<std::pair<std::string, std::string>> StringUtils::parseHeader(const std::string& line) {
    auto colon = line.find(':');
    if (colon == std::string::npos) return std::nullopt;

    std::string name = trim(line.substr(0, colon));
    if (name.empty()) return std::nullopt;

    return std::make_pair(name, trim(line.substr(colon + 1)));
}

int StringUtils::parseStatusLine(const std::string& line) {
    if (!startsWith(line, "HTTP/")) return 0;

    auto space = line.find(' ');
    if (space == std::string::npos || line.size() < space + 4) return 0;

    std::string code = line.substr(space + 1, 3);
    if (!std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return 0;
    }
    if (line.size() > space + 4 && line[space + 4] != ' ') return 0;
    return parseInt(code, 0);
}

std::optional<int64_t> StringUtils::parseContentLength(const std::string& value) {
    std::string digits = trim(value);
    if (digits.empty() || digits.size() > 18) return std::nullopt;
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return parseLong(digits, 0);
}

} // namespace fetchkit::utils
