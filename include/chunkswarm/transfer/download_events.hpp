#pragma once

#include "chunkswarm/core/types.hpp"
#include "chunkswarm/crypto/encryption.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <variant>

namespace chunkswarm::transfer {

struct ChunkReceived {
    core::DeviceKey peer;
    std::uint32_t chunk_index = 0;
    crypto::EncryptedChunk chunk;
};

struct ChunkRefused {
    core::DeviceKey peer;
    std::uint32_t chunk_index = 0;
};

struct PeerConnected {
    core::DeviceKey peer;
};

struct PeerDisconnected {
    core::DeviceKey peer;
};

struct ConnectionTimeout {
    core::DeviceKey peer;
};

struct RediscoverRequested {};
struct PauseRequested {};
struct CancelRequested {};

// Everything a download task reacts to, delivered on its own queue and
// consumed only by its state machine.
using DownloadEvent = std::variant<ChunkReceived, ChunkRefused, PeerConnected, PeerDisconnected,
                                   ConnectionTimeout, RediscoverRequested, PauseRequested, CancelRequested>;

template<typename T>
class EventQueue {
public:
    // False once closed.
    bool push(T event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            events_.push_back(std::move(event));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked();
    }

    template<typename Clock, typename Duration>
    std::optional<T> wait_pop_until(const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, deadline, [this]() { return !events_.empty() || closed_; });
        return pop_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

private:
    std::optional<T> pop_locked() {
        if (events_.empty()) {
            return std::nullopt;
        }
        T event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> events_;
    bool closed_ = false;
};

} // namespace chunkswarm::transfer
