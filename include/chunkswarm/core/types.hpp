#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace chunkswarm::core {

using UserId = std::string;
using DeviceId = std::string;
using FileId = std::string;

// One (user, device) pair. A user with two devices is two seeders.
struct DeviceKey {
    UserId user_id;
    DeviceId device_id;

    DeviceKey() = default;
    DeviceKey(UserId user, DeviceId device)
        : user_id(std::move(user)), device_id(std::move(device)) {}

    bool empty() const { return user_id.empty() || device_id.empty(); }
    std::string to_string() const { return user_id + ":" + device_id; }

    friend bool operator==(const DeviceKey& a, const DeviceKey& b) {
        return a.user_id == b.user_id && a.device_id == b.device_id;
    }
    friend bool operator<(const DeviceKey& a, const DeviceKey& b) {
        return std::tie(a.user_id, a.device_id) < std::tie(b.user_id, b.device_id);
    }
};

struct DeviceKeyHash {
    std::size_t operator()(const DeviceKey& key) const {
        std::size_t h = std::hash<std::string>{}(key.user_id);
        return h ^ (std::hash<std::string>{}(key.device_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

enum class TaskPhase {
    DOWNLOADING,
    DRAINING,
    ASSEMBLING,
    VERIFYING,
    COMPLETE,
    FAILED
};

std::string_view to_string(TaskPhase phase);
std::optional<TaskPhase> parse_task_phase(std::string_view name);

inline bool is_terminal(TaskPhase phase) {
    return phase == TaskPhase::COMPLETE || phase == TaskPhase::FAILED;
}

}
