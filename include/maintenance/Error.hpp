#pragma once

#include <cstdint>
#include <string>

namespace km::maintenance {

enum class ErrorCode {
    PermissionDenied,
    KeyNotFound,
    InvalidArgument,
    SystemError,
    BackendError
};

std::string to_string(ErrorCode code);

struct Error {
    ErrorCode code{ErrorCode::SystemError};
    std::string message;
    int32_t backendCode{0}; // device specific, only meaningful for BackendError

    [[nodiscard]] static Error permissionDenied(std::string msg) { return {ErrorCode::PermissionDenied, std::move(msg)}; }
    [[nodiscard]] static Error keyNotFound(std::string msg) { return {ErrorCode::KeyNotFound, std::move(msg)}; }
    [[nodiscard]] static Error invalidArgument(std::string msg) { return {ErrorCode::InvalidArgument, std::move(msg)}; }
    [[nodiscard]] static Error systemError(std::string msg) { return {ErrorCode::SystemError, std::move(msg)}; }
    [[nodiscard]] static Error backend(const int32_t code, std::string msg) {
        return {ErrorCode::BackendError, std::move(msg), code};
    }
};

std::string to_string(const Error& err);

}
