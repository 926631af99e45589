#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace blockstore {

/**
 * ErrorKind - Classifies a failure so callers can decide between
 * retrying, aborting, or surfacing the problem to a user.
 */
enum class ErrorKind {
    Storage,          // SQLite / connection level failure
    NotFound,         // referenced block or parent does not exist (or is hidden)
    VersionConflict,  // optimistic concurrency precondition failed
    InvalidChildren,  // duplicate child, self-parenting, cycle, cross-root
    DocumentStore,    // façade policy violation
    InvalidFilter,    // filter rejected at construction time
    InvalidArgument,  // malformed call arguments (negative depth, ...)
    Validation        // block payload does not match its type schema
};

[[nodiscard]] constexpr std::string_view kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Storage: return "storage";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::VersionConflict: return "version_conflict";
        case ErrorKind::InvalidChildren: return "invalid_children";
        case ErrorKind::DocumentStore: return "document_store";
        case ErrorKind::InvalidFilter: return "invalid_filter";
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::Validation: return "validation";
    }
    return "unknown";
}

/**
 * Error type for Result - a failure with a kind, a message and, for
 * storage failures, the SQLite result code.
 */
struct Error {
    std::string message;
    int code{0};
    ErrorKind kind{ErrorKind::Storage};

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    Error(ErrorKind k, std::string msg) : message(std::move(msg)), kind(k) {}

    [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind == k; }

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code && kind == other.kind;
    }
};

/**
 * Result<T, E> - Either a successful value (Ok) or an error (Err).
 *
 * Every fallible storage and store operation returns one of these;
 * the library does not throw on its normal paths.
 *
 * Usage:
 *   auto tree = repo.get(id, 1);
 *   if (tree.is_err()) return Result<void, Error>::err(tree.unwrap_err());
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the success value, throwing if this is an error.
     * Intended for tests and for call sites that already checked is_ok().
     */
    [[nodiscard]] T& unwrap() & {
        if (is_err()) throw_unwrap_error();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        if (is_err()) throw_unwrap_error();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) throw_unwrap_error();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    [[nodiscard]] T value_or(T default_value) && {
        if (is_ok()) {
            return std::get<0>(std::move(data_));
        }
        return default_value;
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(data_))));
        }
        return Result<U, E>::err(std::get<1>(std::move(data_)));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    [[noreturn]] void throw_unwrap_error() const {
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Index-based so that T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Specialization for operations that succeed without a value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return is_ok_;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return !is_ok_;
    }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

using Status = Result<void, Error>;

/**
 * Shorthand for building a typed failure.
 */
template<typename T = void>
[[nodiscard]] Result<T, Error> fail(ErrorKind kind, std::string message) {
    return Result<T, Error>::err(Error{kind, std::move(message)});
}

} // namespace blockstore
