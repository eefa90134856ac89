#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace tidemark {

/**
 * ErrorKind - Coarse classification used by callers to decide how to react.
 */
enum class ErrorKind {
    StorageIO,           // SQLite / disk / permission failure; caller may retry
    NotFound,
    InvalidArgument,
    UnknownCollection,   // Collection is not registered by any applied migration
    ConflictResolution,  // A FieldMerge function rejected a pair
    Remote,              // Wrapped remote collaborator failure
    Cancelled,
    Busy                 // Another exclusive operation owns the store
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::StorageIO: return "storage_io";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::UnknownCollection: return "unknown_collection";
        case ErrorKind::ConflictResolution: return "conflict_resolution";
        case ErrorKind::Remote: return "remote";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Busy: return "busy";
    }
    return "unknown";
}

/**
 * Error - Failure carried by Result.
 *
 * `code` holds the SQLite result code for StorageIO errors, 0 otherwise.
 */
struct Error {
    ErrorKind kind{ErrorKind::StorageIO};
    std::string message;
    int code{0};

    Error() = default;
    explicit Error(std::string msg, int c = 0)
        : kind(ErrorKind::StorageIO), message(std::move(msg)), code(c) {}
    Error(ErrorKind k, std::string msg, int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}

    bool operator==(const Error&) const = default;
};

namespace detail {

template<typename E>
[[noreturn]] void throw_unwrap_on_error(const E& error) {
    if constexpr (std::is_same_v<E, Error>) {
        throw std::runtime_error("Result::unwrap() called on error: " + error.message);
    } else {
        (void)error;
        throw std::runtime_error("Result::unwrap() called on error");
    }
}

} // namespace detail

/**
 * Result<T, E> - Either a value (Ok) or an error (Err).
 *
 *   Result<int> parse(std::string_view s);
 *   auto doubled = parse("21").map([](int x) { return x * 2; });
 *
 * unwrap() throws std::runtime_error when called on an error; prefer
 * is_ok()/is_err() checks or the combinators.
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

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

    [[nodiscard]] T& unwrap() & {
        if (is_err()) detail::throw_unwrap_on_error(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        if (is_err()) detail::throw_unwrap_on_error(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) detail::throw_unwrap_on_error(std::get<1>(data_));
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) throw std::runtime_error("Result::unwrap_err() called on success");
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) throw std::runtime_error("Result::unwrap_err() called on success");
        return std::get<1>(data_);
    }

    [[nodiscard]] E unwrap_err() && {
        if (is_ok()) throw std::runtime_error("Result::unwrap_err() called on success");
        return std::get<1>(std::move(data_));
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    [[nodiscard]] T value_or(T fallback) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(fallback);
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_err()) return Result<U, E>::err(std::get<1>(data_));
        if constexpr (std::is_void_v<U>) {
            std::invoke(std::forward<F>(f), std::get<0>(data_));
            return Result<U, E>::ok();
        } else {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_err()) return Result<U, E>::err(std::get<1>(std::move(data_)));
        if constexpr (std::is_void_v<U>) {
            std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
            return Result<U, E>::ok();
        } else {
            return Result<U, E>::ok(
                std::invoke(std::forward<F>(f), std::get<0>(std::move(data_))));
        }
    }

    /**
     * map_err : Result<T, E> -> (E -> F) -> Result<T, F>
     */
    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using NewE = std::invoke_result_t<F, const E&>;
        if (is_ok()) return Result<T, NewE>::ok(std::get<0>(data_));
        return Result<T, NewE>::err(std::invoke(std::forward<F>(f), std::get<1>(data_)));
    }

    template<typename F>
    [[nodiscard]] auto map_err(F&& f) && -> Result<T, std::invoke_result_t<F, E>> {
        using NewE = std::invoke_result_t<F, E>;
        if (is_ok()) return Result<T, NewE>::ok(std::get<0>(std::move(data_)));
        return Result<T, NewE>::err(
            std::invoke(std::forward<F>(f), std::get<1>(std::move(data_))));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_err()) return ResultU::err(std::get<1>(data_));
        return std::invoke(std::forward<F>(f), std::get<0>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_err()) return ResultU::err(std::get<1>(std::move(data_)));
        return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
    }

    /**
     * or_else : Result<T, E> -> (E -> Result<T, F>) -> Result<T, F>
     */
    template<typename F>
    [[nodiscard]] auto or_else(F&& f) const& -> std::invoke_result_t<F, const E&> {
        using ResultT = std::invoke_result_t<F, const E&>;
        if (is_ok()) return ResultT::ok(std::get<0>(data_));
        return std::invoke(std::forward<F>(f), std::get<1>(data_));
    }

    template<typename F>
    const Result& inspect(F&& f) const& {
        if (is_ok()) std::invoke(std::forward<F>(f), std::get<0>(data_));
        return *this;
    }

    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) std::invoke(std::forward<F>(f), std::get<1>(data_));
        return *this;
    }

    template<typename OnOk, typename OnErr>
    [[nodiscard]] auto match(OnOk&& on_ok, OnErr&& on_err) const& {
        if (is_ok()) return std::invoke(std::forward<OnOk>(on_ok), std::get<0>(data_));
        return std::invoke(std::forward<OnErr>(on_err), std::get<1>(data_));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    // Index-based so that T == E still works.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - Success carries no value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() { return Result(); }
    [[nodiscard]] static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool is_ok() const noexcept { return ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !ok_; }

    void unwrap() const {
        if (is_err()) detail::throw_unwrap_on_error(error_);
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) throw std::runtime_error("Result::unwrap_err() called on success");
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) throw std::runtime_error("Result::unwrap_err() called on success");
        return error_;
    }

    [[nodiscard]] E unwrap_err() && {
        if (is_ok()) throw std::runtime_error("Result::unwrap_err() called on success");
        return std::move(error_);
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) const -> Result<std::invoke_result_t<F>, E> {
        using U = std::invoke_result_t<F>;
        if (is_err()) return Result<U, E>::err(error_);
        if constexpr (std::is_void_v<U>) {
            std::invoke(std::forward<F>(f));
            return Result<void, E>::ok();
        } else {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f)));
        }
    }

    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const -> Result<void, std::invoke_result_t<F, const E&>> {
        using NewE = std::invoke_result_t<F, const E&>;
        if (is_ok()) return Result<void, NewE>::ok();
        return Result<void, NewE>::err(std::invoke(std::forward<F>(f), error_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_err()) return ResultU::err(error_);
        return std::invoke(std::forward<F>(f));
    }

    template<typename F>
    const Result& inspect_err(F&& f) const {
        if (is_err()) std::invoke(std::forward<F>(f), error_);
        return *this;
    }

private:
    Result() : ok_(true) {}
    explicit Result(E error) : ok_(false), error_(std::move(error)) {}

    bool ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

/**
 * Re-wrap the error of a failed Result as another Result type.
 * Use only after is_err() has been checked.
 */
template<typename To, typename From>
[[nodiscard]] To propagate(From&& failed) {
    return To::err(std::forward<From>(failed).unwrap_err());
}

} // namespace tidemark
