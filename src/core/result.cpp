#include "chunkswarm/core/result.hpp"

namespace chunkswarm::core {

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::UNAUTHORIZED: return "unauthorized";
        case ErrorCode::CORRUPT: return "corrupt";
        case ErrorCode::TIMEOUT: return "timeout";
        case ErrorCode::CONFLICT: return "conflict";
        case ErrorCode::STORAGE_FAILURE: return "storage_failure";
        case ErrorCode::INVALID_STATE: return "invalid_state";
        case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
    }
    return "unknown";
}

std::string Result::describe() const {
    std::string text(to_string(error));
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

}
