#pragma once

#include "chunkswarm/core/chunk_bitmap.hpp"
#include "chunkswarm/core/clock.hpp"
#include "chunkswarm/core/types.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace chunkswarm::transfer {

struct ChunkAssignment {
    core::DeviceKey peer;
    std::uint32_t chunk_index = 0;
};

enum class ReleaseReason {
    // Peer said it does not have the chunk, or sent one that failed
    // verification. The peer is never asked for that index again.
    REFUSED,
    // Timeout or local storage trouble. Another peer is preferred next time.
    RETRY
};

// Decides which peer fetches which missing chunk. Each peer holds at most
// its capacity of outstanding requests and every index has at most one
// in-flight owner. Not thread-safe; owned by a single download task.
class ChunkScheduler {
public:
    ChunkScheduler(std::uint32_t chunk_count, const core::ChunkBitmap& completed);

    void update_peer(const core::DeviceKey& peer, const core::ChunkBitmap& available, std::uint32_t capacity);
    void set_ready(const core::DeviceKey& peer, bool ready);
    // Drops the peer and returns the indices it had in flight, now requeued.
    std::vector<std::uint32_t> remove_peer(const core::DeviceKey& peer);
    bool has_peer(const core::DeviceKey& peer) const { return peers_.count(peer) > 0; }
    std::vector<core::DeviceKey> peers() const;

    std::vector<ChunkAssignment> next_assignments(core::TimePoint now);

    std::optional<core::DeviceKey> owner(std::uint32_t chunk_index) const;
    void mark_completed(std::uint32_t chunk_index);
    // Returns the request to the queue. No-op unless peer owns the index.
    void release(std::uint32_t chunk_index, const core::DeviceKey& peer, ReleaseReason reason);
    // Requests outstanding longer than timeout; each is released as RETRY.
    // The index may go to another peer, but the expired request keeps
    // counting against its peer's capacity until response_arrived or one
    // more timeout passes.
    std::vector<ChunkAssignment> expire(core::TimePoint now, std::chrono::milliseconds timeout);
    // A peer answered (data or refusal) for chunk_index.
    void response_arrived(const core::DeviceKey& peer, std::uint32_t chunk_index);

    size_t in_flight_count() const { return in_flight_.size(); }
    size_t in_flight_for(const core::DeviceKey& peer) const;
    // Owned requests plus expired ones still unanswered.
    size_t load_on(const core::DeviceKey& peer) const;
    const core::ChunkBitmap& completed() const { return completed_; }

    // Missing indices that no known peer could ever serve.
    std::vector<std::uint32_t> unservable() const;
    // True when some ready peer can serve some missing index.
    bool has_usable_peer() const;

private:
    struct PeerState {
        core::ChunkBitmap available;
        std::uint32_t capacity = 1;
        std::uint32_t outstanding = 0;
        std::multimap<std::uint32_t, core::TimePoint> stale;
        bool ready = false;

        std::uint32_t load() const { return outstanding + static_cast<std::uint32_t>(stale.size()); }
    };

    struct InFlight {
        core::DeviceKey peer;
        core::TimePoint requested_at;
    };

    bool can_serve(const core::DeviceKey& peer, const PeerState& state, std::uint32_t index) const;
    void clear_owner(std::uint32_t chunk_index);

    std::uint32_t chunk_count_;
    core::ChunkBitmap completed_;
    std::map<core::DeviceKey, PeerState> peers_;
    std::map<std::uint32_t, InFlight> in_flight_;
    std::map<std::uint32_t, std::set<core::DeviceKey>> refused_;
    std::map<std::uint32_t, core::DeviceKey> avoid_;
};

} // namespace chunkswarm::transfer
