#include "chunkswarm/core/utils.hpp"
#include <iterator>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>

namespace chunkswarm::core::utils {

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    size_t begin = 0;
    while (begin < str.size()) {
        auto end = str.find(delimiter, begin);
        if (end == std::string::npos) {
            end = str.size();
        }
        result.emplace_back(str, begin, end - begin);
        begin = end + 1;
    }
    return result;
}

std::string StringUtils::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string joined;
    for (const auto& part : parts) {
        if (&part != &parts.front()) {
            joined += delimiter;
        }
        joined += part;
    }
    return joined;
}

std::string StringUtils::trim(const std::string& str) {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        end--;
    }

    return std::string(start, end);
}

std::string StringUtils::to_lower(const std::string& str) {
    std::string lower;
    lower.reserve(str.size());
    for (unsigned char c : str) {
        lower.push_back(static_cast<char>(std::tolower(c)));
    }
    return lower;
}

std::string StringUtils::format_bytes(std::uint64_t bytes) {
    static constexpr const char* UNITS[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr size_t LAST_UNIT = std::size(UNITS) - 1;

    double scaled = static_cast<double>(bytes);
    size_t unit = 0;
    for (; scaled >= 1024.0 && unit < LAST_UNIT; ++unit) {
        scaled /= 1024.0;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << scaled << " " << UNITS[unit];
    return oss.str();
}

std::string StringUtils::format_duration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }

    auto seconds = ms / 1000;
    if (seconds < 60) {
        return std::to_string(seconds) + "s";
    }

    auto minutes = seconds / 60;
    seconds %= 60;
    if (minutes < 60) {
        return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    }

    auto hours = minutes / 60;
    minutes %= 60;
    if (hours < 48) {
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    }

    return std::to_string(hours / 24) + "d " + std::to_string(hours % 24) + "h";
}

bool FileUtils::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::optional<std::uint64_t> FileUtils::file_size(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

bool FileUtils::create_directories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec && std::filesystem::is_directory(path, ec);
}

std::filesystem::path FileUtils::get_home_dir() {
    const char* home = std::getenv("HOME");
    return home ? std::filesystem::path(home) : std::filesystem::path(".");
}

std::filesystem::path FileUtils::expand_user(const std::string& path) {
    if (path == "~") {
        return get_home_dir();
    }
    if (path.rfind("~/", 0) == 0) {
        return get_home_dir() / path.substr(2);
    }
    return std::filesystem::path(path);
}

bool FileUtils::sync_file(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return false;
    }
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

std::string TimeUtils::to_iso_string(const std::chrono::system_clock::time_point& time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string TimeUtils::format_timestamp(const std::chrono::system_clock::time_point& time) {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}
