#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace chunkswarm::core {

// Process-wide key=value settings. Typed snapshots (StorageConfig,
// TrackerSettings, SwarmSettings, GcSettings) are built from it at startup.
//
// Files are INI-like: `[tracker]` followed by `port = 7420` sets
// "tracker.port". Keys may also be written fully qualified outside a section.
class Config {
public:
    static Config& instance();

    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;

    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) {
            return std::nullopt;
        }
        std::istringstream stream(*value);
        T result{};
        stream >> result;
        if (stream.fail() || !stream.eof()) {
            return std::nullopt;
        }
        return result;
    }

    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::int64_t get_int64(const std::string& key, std::int64_t default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    void set_defaults();
    void clear();

private:
    Config() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

}
