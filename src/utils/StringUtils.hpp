// FetchKit - String Utilities
// String manipulation and human-readable formatting

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace fetchkit::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);

    static bool startsWith(const std::string& str, const std::string& prefix);

    // Formatting
    static std::string formatBytes(int64_t bytes);
    static std::string formatSpeed(double bytesPerSecond);
    static std::string formatEta(std::optional<double> seconds);
    static std::string formatTimestamp(std::chrono::system_clock::time_point time,
                                       const std::string& format = "%Y-%m-%d %H:%M:%S");
    static std::string formatPercentage(double percent, int precision = 1);

    // Parsing
    static int parseInt(const std::string& str, int defaultValue = 0);
    static int64_t parseLong(const std::string& str, int64_t defaultValue = 0);

    /**
     * Split "Name: value" into a header pair
     * @return Empty if there is no colon or the name is blank
     */
    static std::optional<std::pair<std::string, std::string>> parseHeader(const std::string& line);

    /**
     * Status code of an HTTP status line ("HTTP/1.1 206 Partial Content", "HTTP/2 200")
     * @return 0 if the line is not a status line
     */
    static int parseStatusLine(const std::string& line);

    /**
     * Content-Length header value
     * @return Empty unless the value is a non-negative decimal number
     */
    static std::optional<int64_t> parseContentLength(const std::string& value);
};

} // namespace fetchkit::utils
