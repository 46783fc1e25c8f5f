#include "chunkswarm/transfer/chunk_scheduler.hpp"
#include "chunkswarm/core/logger.hpp"

namespace chunkswarm::transfer {

ChunkScheduler::ChunkScheduler(std::uint32_t chunk_count, const core::ChunkBitmap& completed)
    : chunk_count_(chunk_count)
    , completed_(completed.size() == chunk_count ? completed : core::ChunkBitmap(chunk_count)) {
}

void ChunkScheduler::update_peer(const core::DeviceKey& peer, const core::ChunkBitmap& available,
                                 std::uint32_t capacity) {
    if (available.size() != chunk_count_) {
        LOG_WARN("Ignoring peer {} with a {}-chunk bitmap (expected {})",
                 peer.to_string(), available.size(), chunk_count_);
        return;
    }
    auto& state = peers_[peer];
    state.available = available;
    state.capacity = capacity > 0 ? capacity : 1;
}

void ChunkScheduler::set_ready(const core::DeviceKey& peer, bool ready) {
    auto it = peers_.find(peer);
    if (it != peers_.end()) {
        it->second.ready = ready;
    }
}

std::vector<std::uint32_t> ChunkScheduler::remove_peer(const core::DeviceKey& peer) {
    std::vector<std::uint32_t> requeued;
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
        if (it->second.peer == peer) {
            requeued.push_back(it->first);
            it = in_flight_.erase(it);
        } else {
            ++it;
        }
    }
    peers_.erase(peer);
    return requeued;
}

std::vector<core::DeviceKey> ChunkScheduler::peers() const {
    std::vector<core::DeviceKey> result;
    result.reserve(peers_.size());
    for (const auto& [peer, state] : peers_) {
        result.push_back(peer);
    }
    return result;
}

std::vector<ChunkAssignment> ChunkScheduler::next_assignments(core::TimePoint now) {
    std::vector<ChunkAssignment> assignments;

    auto spare_capacity = [this]() {
        std::uint32_t spare = 0;
        for (const auto& [peer, state] : peers_) {
            if (state.ready && state.load() < state.capacity) {
                spare += state.capacity - state.load();
            }
        }
        return spare;
    };

    if (spare_capacity() == 0) {
        return assignments;
    }

    auto missing = completed_.missing_indices();

    // First pass honours "prefer another peer" hints; the second lets the
    // hinted peer take the chunk when nobody else could.
    for (int pass = 0; pass < 2; ++pass) {
        for (auto index : missing) {
            if (in_flight_.count(index) > 0) {
                continue;
            }

            auto avoid = avoid_.find(index);
            PeerState* best_state = nullptr;
            const core::DeviceKey* best_peer = nullptr;

            for (auto& [peer, state] : peers_) {
                if (!state.ready || state.load() >= state.capacity || !can_serve(peer, state, index)) {
                    continue;
                }
                if (pass == 0 && avoid != avoid_.end() && avoid->second == peer) {
                    continue;
                }
                if (!best_state || state.load() < best_state->load()) {
                    best_state = &state;
                    best_peer = &peer;
                }
            }

            if (!best_state) {
                continue;
            }

            ++best_state->outstanding;
            in_flight_[index] = InFlight{*best_peer, now};
            assignments.push_back(ChunkAssignment{*best_peer, index});

            if (spare_capacity() == 0) {
                return assignments;
            }
        }
    }

    return assignments;
}

std::optional<core::DeviceKey> ChunkScheduler::owner(std::uint32_t chunk_index) const {
    auto it = in_flight_.find(chunk_index);
    if (it == in_flight_.end()) {
        return std::nullopt;
    }
    return it->second.peer;
}

void ChunkScheduler::mark_completed(std::uint32_t chunk_index) {
    if (chunk_index >= chunk_count_) {
        return;
    }
    completed_.set(chunk_index);
    clear_owner(chunk_index);
    refused_.erase(chunk_index);
    avoid_.erase(chunk_index);
}

void ChunkScheduler::release(std::uint32_t chunk_index, const core::DeviceKey& peer, ReleaseReason reason) {
    auto it = in_flight_.find(chunk_index);
    if (it != in_flight_.end() && it->second.peer == peer) {
        clear_owner(chunk_index);
    }

    if (reason == ReleaseReason::REFUSED) {
        refused_[chunk_index].insert(peer);
    } else {
        avoid_[chunk_index] = peer;
    }
}

std::vector<ChunkAssignment> ChunkScheduler::expire(core::TimePoint now, std::chrono::milliseconds timeout) {
    // Stale requests whose answer never came stop counting against the peer
    // after a second timeout.
    for (auto& [peer, state] : peers_) {
        for (auto it = state.stale.begin(); it != state.stale.end();) {
            if (now - it->second >= timeout) {
                it = state.stale.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::vector<ChunkAssignment> expired;
    for (const auto& [index, request] : in_flight_) {
        if (now - request.requested_at >= timeout) {
            expired.push_back(ChunkAssignment{request.peer, index});
        }
    }
    for (const auto& assignment : expired) {
        release(assignment.chunk_index, assignment.peer, ReleaseReason::RETRY);
        // The peer may still be working on it, so its slot stays taken.
        auto peer = peers_.find(assignment.peer);
        if (peer != peers_.end()) {
            peer->second.stale.emplace(assignment.chunk_index, now);
        }
    }
    return expired;
}

void ChunkScheduler::response_arrived(const core::DeviceKey& peer, std::uint32_t chunk_index) {
    auto it = peers_.find(peer);
    if (it == peers_.end()) {
        return;
    }
    auto stale = it->second.stale.find(chunk_index);
    if (stale != it->second.stale.end()) {
        it->second.stale.erase(stale);
    }
}

size_t ChunkScheduler::in_flight_for(const core::DeviceKey& peer) const {
    auto it = peers_.find(peer);
    return it == peers_.end() ? 0 : it->second.outstanding;
}

size_t ChunkScheduler::load_on(const core::DeviceKey& peer) const {
    auto it = peers_.find(peer);
    return it == peers_.end() ? 0 : it->second.load();
}

std::vector<std::uint32_t> ChunkScheduler::unservable() const {
    std::vector<std::uint32_t> result;
    for (auto index : completed_.missing_indices()) {
        bool servable = false;
        for (const auto& [peer, state] : peers_) {
            if (can_serve(peer, state, index)) {
                servable = true;
                break;
            }
        }
        if (!servable) {
            result.push_back(index);
        }
    }
    return result;
}

bool ChunkScheduler::has_usable_peer() const {
    auto missing = completed_.missing_indices();
    for (const auto& [peer, state] : peers_) {
        if (!state.ready) {
            continue;
        }
        for (auto index : missing) {
            if (can_serve(peer, state, index)) {
                return true;
            }
        }
    }
    return false;
}

bool ChunkScheduler::can_serve(const core::DeviceKey& peer, const PeerState& state, std::uint32_t index) const {
    if (!state.available.test(index)) {
        return false;
    }
    auto refused = refused_.find(index);
    return refused == refused_.end() || refused->second.count(peer) == 0;
}

void ChunkScheduler::clear_owner(std::uint32_t chunk_index) {
    auto it = in_flight_.find(chunk_index);
    if (it == in_flight_.end()) {
        return;
    }
    auto peer = peers_.find(it->second.peer);
    if (peer != peers_.end() && peer->second.outstanding > 0) {
        --peer->second.outstanding;
    }
    in_flight_.erase(it);
}

} // namespace chunkswarm::transfer
