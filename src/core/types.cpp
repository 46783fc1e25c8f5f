#include "chunkswarm/core/types.hpp"

namespace chunkswarm::core {

std::string_view to_string(TaskPhase phase) {
    switch (phase) {
        case TaskPhase::DOWNLOADING: return "downloading";
        case TaskPhase::DRAINING: return "draining";
        case TaskPhase::ASSEMBLING: return "assembling";
        case TaskPhase::VERIFYING: return "verifying";
        case TaskPhase::COMPLETE: return "complete";
        case TaskPhase::FAILED: return "failed";
    }
    return "unknown";
}

std::optional<TaskPhase> parse_task_phase(std::string_view name) {
    for (auto phase : {TaskPhase::DOWNLOADING, TaskPhase::DRAINING, TaskPhase::ASSEMBLING,
                       TaskPhase::VERIFYING, TaskPhase::COMPLETE, TaskPhase::FAILED}) {
        if (to_string(phase) == name) {
            return phase;
        }
    }
    return std::nullopt;
}

}
