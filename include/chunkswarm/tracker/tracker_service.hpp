#pragma once

#include "chunkswarm/tracker/tracker.hpp"
#include "chunkswarm/tracker/tracker_messages.hpp"
#include <optional>

namespace chunkswarm::tracker {

// Maps decoded requests from an authenticated session onto the Tracker.
class TrackerService {
public:
    explicit TrackerService(Tracker& tracker);

    // Reply for request messages; nullopt for anything that is not a request
    // (heartbeats, stray results or notifications).
    std::optional<TrackerMessage> handle(const core::DeviceKey& session_device, const TrackerMessage& request);

private:
    TrackerMessage on_announce(const core::DeviceKey& session_device, const AnnounceMessage& msg);
    TrackerMessage on_reannounce(const core::DeviceKey& session_device, const ReannounceMessage& msg);
    TrackerMessage on_get_available_chunks(const core::DeviceKey& session_device, const GetAvailableChunksMessage& msg);

    Tracker& tracker_;
};

}
