#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace rp {

struct Error {
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : message(std::move(msg)) {}

    /// Same error with "<what>: " in front, for callers adding where it
    /// happened.
    Error with_context(std::string_view what) const {
        return Error(std::string(what) + ": " + message);
    }
};

/// Holds either a value of type T or an Error. Loaders return these and
/// callers decide whether a failure degrades to empty data or aborts.
/// For void results, use Result<void>.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    const Error& error() const { return std::get<Error>(data_); }

    /// The value, or `fallback` on error.
    T value_or(T fallback) const {
        return ok() ? value() : std::move(fallback);
    }

private:
    std::variant<T, Error> data_;
};

/// Specialization for void results.
template <>
class Result<void> {
public:
    Result() : err_(std::nullopt) {}
    Result(Error err) : err_(std::move(err)) {}

    bool ok() const { return !err_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return err_.value(); }

private:
    std::optional<Error> err_;
};

} // namespace rp
