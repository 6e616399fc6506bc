/**
 * FileUtils.cpp
 *
 * File system operations.
 */

#include "FileUtils.hpp"

#include <fstream>
#include <iterator>
#include <random>

namespace fetchkit::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool FileUtils::createParentDirectories(const fs::path& path) {
    auto parent = path.parent_path();
    if (parent.empty()) return true;
    return createDirectories(parent);
}

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool FileUtils::deleteFile(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    return !ec;
}

int64_t FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return -1;
    auto size = fs::file_size(path, ec);
    return ec ? -1 : static_cast<int64_t>(size);
}

// -- Read/Write --

std::optional<std::string> FileUtils::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool FileUtils::writeFile(const fs::path& path, const std::string& content) {
    if (!createParentDirectories(path)) return false;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return false;
    file << content;
    file.flush();
    return file.good();
}

// -- Temp files --

fs::path FileUtils::createTempDirectory(const std::string& prefix) {
    std::random_device rd;
    std::error_code ec;
    auto base = fs::temp_directory_path(ec);
    if (ec) base = fs::current_path();

    fs::path temp;
    do {
        temp = base / (prefix + std::to_string(rd()));
    } while (fs::exists(temp, ec));

    fs::create_directories(temp, ec);
    return temp;
}

} // namespace fetchkit::utils
