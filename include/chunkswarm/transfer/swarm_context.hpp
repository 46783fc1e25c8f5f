#pragma once

#include "chunkswarm/core/clock.hpp"
#include "chunkswarm/core/types.hpp"
#include "chunkswarm/transfer/swarm_types.hpp"

namespace chunkswarm::storage {
class ChunkStore;
class ChunkManager;
class FileIndex;
class ResumeManager;
}

namespace chunkswarm::crypto { class FileKeyCache; }
namespace chunkswarm::tracker { class TrackerApi; }

namespace chunkswarm::transfer {

// Collaborators shared by the coordinator, its download tasks and the
// upload service of one device. Owned by the caller.
struct SwarmContext {
    core::DeviceKey self;
    storage::ChunkStore& store;
    storage::ChunkManager& chunks;
    storage::FileIndex& files;
    storage::ResumeManager& resume;
    tracker::TrackerApi& tracker;
    crypto::FileKeyCache& keys;
    core::Clock& clock;
    SwarmSettings settings;
};

} // namespace chunkswarm::transfer
