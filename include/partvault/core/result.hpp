#pragma once

#include <string>
#include <utility>

namespace partvault::core {

enum class ErrorCode {
    SUCCESS = 0,
    NOT_FOUND,
    IO_ERROR,
    PARSE_ERROR,
    TRANSIENT_TRANSPORT_ERROR,
    PERMANENT_TRANSPORT_ERROR,
    INCOMPLETE_MANIFEST,
    PARTIAL_DOWNLOAD,
    INTEGRITY_ERROR,
    CANCELLED,
    INVALID_ARGUMENT
};

const char* to_string(ErrorCode code);

struct Result {
    ErrorCode error;
    std::string message;

    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }
};

} // namespace partvault::core
