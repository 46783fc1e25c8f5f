#pragma once

#include <string>
#include <string_view>

namespace chunkswarm::core {

enum class ErrorCode {
    SUCCESS = 0,
    NOT_FOUND,
    UNAUTHORIZED,
    CORRUPT,
    TIMEOUT,
    CONFLICT,
    STORAGE_FAILURE,
    INVALID_STATE,
    INVALID_ARGUMENT
};

std::string_view to_string(ErrorCode code);

struct Result {
    ErrorCode error;
    std::string message;

    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    static Result ok() { return Result(); }
    static Result fail(ErrorCode err, std::string msg) { return Result(err, std::move(msg)); }

    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }

    std::string describe() const;
};

}
