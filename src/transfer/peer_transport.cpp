#include "chunkswarm/transfer/peer_transport.hpp"

namespace chunkswarm::transfer {

std::string_view to_string(PeerConnectionState state) {
    switch (state) {
        case PeerConnectionState::CONNECTING: return "connecting";
        case PeerConnectionState::ESTABLISHED: return "established";
        case PeerConnectionState::FAILED: return "failed";
        case PeerConnectionState::CLOSED: return "closed";
    }
    return "unknown";
}

} // namespace chunkswarm::transfer
