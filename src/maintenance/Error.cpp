#include "maintenance/Error.hpp"

#include <fmt/format.h>

namespace km::maintenance {

std::string to_string(const ErrorCode code) {
    switch (code) {
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::KeyNotFound: return "KeyNotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::SystemError: return "SystemError";
        case ErrorCode::BackendError: return "BackendError";
    }
    return "Unknown";
}

std::string to_string(const Error& err) {
    if (err.code == ErrorCode::BackendError)
        return fmt::format("{} ({}): {}", to_string(err.code), err.backendCode, err.message);
    return fmt::format("{}: {}", to_string(err.code), err.message);
}

}
