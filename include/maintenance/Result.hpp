#pragma once

#include "maintenance/Error.hpp"

#include <stdexcept>
#include <utility>
#include <variant>

namespace km::maintenance {

// Success value or one of the ErrorCode kinds.
template <typename T>
class [[nodiscard]] Result {
public:
    Result(T value) : v_(std::move(value)) {}
    Result(Error err) : v_(std::move(err)) {}

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(v_); }
    explicit operator bool() const { return ok(); }

    [[nodiscard]] const T& value() const& {
        if (!ok()) throw std::logic_error("Result::value() on error: " + to_string(std::get<Error>(v_)));
        return std::get<T>(v_);
    }

    [[nodiscard]] T&& value() && {
        if (!ok()) throw std::logic_error("Result::value() on error: " + to_string(std::get<Error>(v_)));
        return std::get<T>(std::move(v_));
    }

    [[nodiscard]] const Error& error() const {
        if (ok()) throw std::logic_error("Result::error() on success");
        return std::get<Error>(v_);
    }

    [[nodiscard]] ErrorCode code() const { return error().code; }

private:
    std::variant<T, Error> v_;
};

template <>
class [[nodiscard]] Result<void> {
public:
    Result() = default;
    Result(Error err) : err_(std::move(err)), ok_(false) {}

    [[nodiscard]] bool ok() const { return ok_; }
    explicit operator bool() const { return ok_; }

    [[nodiscard]] const Error& error() const {
        if (ok_) throw std::logic_error("Result::error() on success");
        return err_;
    }

    [[nodiscard]] ErrorCode code() const { return error().code; }

private:
    Error err_{};
    bool ok_{true};
};

using Status = Result<void>;

inline Status ok() { return {}; }

}
