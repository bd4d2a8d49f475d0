#pragma once

#include <vkframe/error.hpp>

#include <cassert>
#include <optional>
#include <utility>
#include <variant>

namespace vkframe {

// Either a value or an Error. Check ok(), then unwrap.
// Frame-path calls return these so the caller decides whether a native
// failure is fatal (orThrow) or can be reported and skipped.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}     // NOLINT implicit
    Result(Error error) : data_(std::move(error)) {} // NOLINT implicit

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    [[nodiscard]] T& value() & {
        assert(ok() && "value() on error Result");
        return std::get<T>(data_);
    }
    [[nodiscard]] const T& value() const& {
        assert(ok() && "value() on error Result");
        return std::get<T>(data_);
    }
    [[nodiscard]] T value() && {
        assert(ok() && "value() on error Result");
        return std::move(std::get<T>(data_));
    }

    [[nodiscard]] const Error& error() const& {
        assert(!ok() && "error() on ok Result");
        return std::get<Error>(data_);
    }
    [[nodiscard]] Error error() && {
        assert(!ok() && "error() on ok Result");
        return std::move(std::get<Error>(data_));
    }

    // Unwrap, escalating through throwError() on failure.
    [[nodiscard]] T orThrow() && {
        if (!ok()) throwError(std::get<Error>(data_));
        return std::move(std::get<T>(data_));
    }

private:
    std::variant<T, Error> data_;
};

// Success carries nothing.
template <>
class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {} // NOLINT implicit

    [[nodiscard]] bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    [[nodiscard]] const Error& error() const& {
        assert(!ok() && "error() on ok Result<void>");
        return *error_;
    }
    [[nodiscard]] Error error() && {
        assert(!ok() && "error() on ok Result<void>");
        return std::move(*error_);
    }

    void orThrow() && {
        if (!ok()) throwError(*error_);
    }

private:
    std::optional<Error> error_;
};

} // namespace vkframe
