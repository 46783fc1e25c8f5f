#pragma once

#include "chunkswarm/core/types.hpp"
#include "chunkswarm/transfer/peer_messages.hpp"
#include <functional>
#include <string_view>

namespace chunkswarm::transfer {

enum class PeerConnectionState {
    CONNECTING,
    ESTABLISHED,
    FAILED,
    CLOSED
};

std::string_view to_string(PeerConnectionState state);

// Ordered, reliable channel per peer. Connection establishment (including
// any NAT traversal) is the implementation's business; state changes are
// reported through the state handler.
class PeerTransport {
public:
    using MessageHandler = std::function<void(const core::DeviceKey& peer, const PeerMessage& message)>;
    using StateHandler = std::function<void(const core::DeviceKey& peer, PeerConnectionState state)>;

    virtual ~PeerTransport() = default;

    // Asynchronous. Reports CONNECTING, then ESTABLISHED or FAILED.
    virtual void connect(const core::DeviceKey& peer) = 0;
    virtual void disconnect(const core::DeviceKey& peer) = 0;
    virtual bool send(const core::DeviceKey& peer, const PeerMessage& message) = 0;
    virtual PeerConnectionState state(const core::DeviceKey& peer) const = 0;

    virtual void set_message_handler(MessageHandler handler) = 0;
    virtual void set_state_handler(StateHandler handler) = 0;
};

// Shared access to peer connections for the download tasks of one device.
// Connections are reference counted by the tasks using them.
class PeerPool {
public:
    virtual ~PeerPool() = default;

    virtual void acquire(const core::DeviceKey& peer) = 0;
    virtual void release(const core::DeviceKey& peer) = 0;
    virtual bool is_established(const core::DeviceKey& peer) const = 0;
    virtual bool send(const core::DeviceKey& peer, const PeerMessage& message) = 0;
};

} // namespace chunkswarm::transfer
