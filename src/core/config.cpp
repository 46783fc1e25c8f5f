#include "chunkswarm/core/config.hpp"
#include "chunkswarm/core/logger.hpp"
#include "chunkswarm/core/utils.hpp"
#include <array>
#include <fstream>
#include <utility>

namespace chunkswarm::core {

using utils::StringUtils;

namespace {

constexpr std::array<std::pair<const char*, const char*>, 22> DEFAULTS = {{
    {"tracker.port", "7420"},
    {"tracker.file_ttl_days", "30"},
    {"tracker.ttl_refresh_threshold_days", "3"},
    {"tracker.seeder_ttl_days", "30"},
    {"tracker.delete_grace_seconds", "300"},
    {"tracker.sweep_interval_seconds", "3600"},
    {"transfer.chunk_size", "65536"},
    {"transfer.max_in_flight_per_peer", "5"},
    {"transfer.drain_timeout_ms", "5000"},
    {"transfer.request_timeout_ms", "30000"},
    {"transfer.max_storage_retries", "3"},
    {"transfer.max_concurrent_uploads", "4"},
    {"transfer.max_queued_per_peer", "32"},
    {"transfer.connect_timeout_ms", "15000"},
    {"transfer.no_seeder_timeout_seconds", "600"},
    {"transfer.rediscovery_interval_seconds", "30"},
    {"transfer.activity_report_interval_seconds", "60"},
    {"gc.interval_seconds", "3600"},
    {"gc.seeder_ttl_days", "30"},
    {"storage.base_dir", "./chunkswarm_data"},
    {"log.level", "info"},
    {"log.file", "chunkswarm.log"},
}};

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::map<std::string, std::string> loaded;
    std::string section;
    std::string raw;
    size_t line_number = 0;

    while (std::getline(file, raw)) {
        ++line_number;
        auto line = StringUtils::trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line.front() == '[' && line.back() == ']') {
            section = StringUtils::trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        auto key = eq == std::string::npos ? std::string() : StringUtils::trim(line.substr(0, eq));
        if (key.empty()) {
            LOG_WARN("{}:{}: ignoring malformed line", filename, line_number);
            continue;
        }
        if (!section.empty()) {
            key = section + "." + key;
        }
        loaded[key] = StringUtils::trim(line.substr(eq + 1));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, value] : loaded) {
        values_[key] = std::move(value);
    }
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::map<std::string, std::map<std::string, std::string>> sections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, value] : values_) {
            auto dot = key.find('.');
            if (dot == std::string::npos) {
                sections[""][key] = value;
            } else {
                sections[key.substr(0, dot)][key.substr(dot + 1)] = value;
            }
        }
    }

    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# chunkswarm configuration\n";
    // Unsectioned keys sort first, before any header can capture them.
    for (const auto& [section, entries] : sections) {
        file << "\n";
        if (!section.empty()) {
            file << "[" << section << "]\n";
        }
        for (const auto& [key, value] : entries) {
            file << key << " = " << value << "\n";
        }
    }
    return file.good();
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) {
        return default_value;
    }
    auto lower = StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

int Config::get_int(const std::string& key, int default_value) const {
    return get_as<int>(key).value_or(default_value);
}

std::int64_t Config::get_int64(const std::string& key, std::int64_t default_value) const {
    return get_as<std::int64_t>(key).value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::set_defaults() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : DEFAULTS) {
        values_[key] = value;
    }
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

}
