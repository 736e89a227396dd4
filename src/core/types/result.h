// core/types/result.h
#ifndef FUNCMODEL_CORE_TYPES_RESULT_H
#define FUNCMODEL_CORE_TYPES_RESULT_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace funcmodel {

enum class ErrorKind : uint8_t {
    VALIDATION,
    NOT_FOUND,
    CONFLICT,
    ACCESS_DENIED,
    INVALID_STATE,
    INTERNAL
};

std::string_view to_string(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::INTERNAL;
    std::string message;

    bool operator==(const Error&) const = default;
};

template <typename T>
class Result;

namespace detail {
template <typename>
struct is_result : std::false_type {};
template <typename U>
struct is_result<Result<U>> : std::true_type {};
} // namespace detail

// Success/failure channel for domain operations.
// Reading value() of a failure, or error() of a success, is a caller defect and throws std::logic_error.
template <typename T>
class Result {
public:
    using value_type = T;

    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result fail(Error error) { return Result(std::in_place_index<1>, std::move(error)); }
    static Result fail(ErrorKind kind, std::string message) {
        return fail(Error{kind, std::move(message)});
    }

    // Implicit lift of an Error so that failures propagate with a plain `return res.error();`
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool is_success() const { return data_.index() == 0; }
    bool is_failure() const { return data_.index() == 1; }
    explicit operator bool() const { return is_success(); }

    const T& value() const& {
        if (!is_success()) throw std::logic_error("Result::value() called on failure: " + std::get<1>(data_).message);
        return std::get<0>(data_);
    }
    T& value() & {
        if (!is_success()) throw std::logic_error("Result::value() called on failure: " + std::get<1>(data_).message);
        return std::get<0>(data_);
    }
    T&& value() && {
        if (!is_success()) throw std::logic_error("Result::value() called on failure: " + std::get<1>(data_).message);
        return std::get<0>(std::move(data_));
    }

    const Error& error() const {
        if (!is_failure()) throw std::logic_error("Result::error() called on success");
        return std::get<1>(data_);
    }
    ErrorKind error_kind() const { return error().kind; }
    const std::string& message() const { return error().message; }

    T value_or(T fallback) const {
        return is_success() ? std::get<0>(data_) : std::move(fallback);
    }

    template <typename F>
    auto map(F&& f) const -> Result<std::invoke_result_t<F, const T&>> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_failure()) return Result<U>::fail(std::get<1>(data_));
        if constexpr (std::is_void_v<U>) {
            f(std::get<0>(data_));
            return Result<U>::ok();
        } else {
            return Result<U>::ok(f(std::get<0>(data_)));
        }
    }

    // f must return a Result; the first failure short-circuits
    template <typename F>
    auto flat_map(F&& f) const -> std::invoke_result_t<F, const T&> {
        using R = std::invoke_result_t<F, const T&>;
        static_assert(detail::is_result<R>::value, "flat_map callback must return a Result");
        if (is_failure()) return R::fail(std::get<1>(data_));
        return f(std::get<0>(data_));
    }

    template <typename OnOk, typename OnErr>
    auto fold(OnOk&& on_ok, OnErr&& on_err) const {
        return is_success() ? on_ok(std::get<0>(data_)) : on_err(std::get<1>(data_));
    }

    // f maps an Error to a replacement T
    template <typename F>
    Result recover(F&& f) const {
        if (is_success()) return *this;
        return Result::ok(f(std::get<1>(data_)));
    }

private:
    template <size_t I, typename A>
    Result(std::in_place_index_t<I> tag, A&& arg) : data_(tag, std::forward<A>(arg)) {}

    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    using value_type = void;

    static Result ok() { return Result(); }
    static Result fail(Error error) { return Result(std::move(error)); }
    static Result fail(ErrorKind kind, std::string message) {
        return fail(Error{kind, std::move(message)});
    }

    Result(Error error) : error_(std::move(error)), failed_(true) {}

    bool is_success() const { return !failed_; }
    bool is_failure() const { return failed_; }
    explicit operator bool() const { return is_success(); }

    void value() const {
        if (failed_) throw std::logic_error("Result::value() called on failure: " + error_.message);
    }

    const Error& error() const {
        if (!failed_) throw std::logic_error("Result::error() called on success");
        return error_;
    }
    ErrorKind error_kind() const { return error().kind; }
    const std::string& message() const { return error().message; }

    template <typename F>
    auto map(F&& f) const -> Result<std::invoke_result_t<F>> {
        using U = std::invoke_result_t<F>;
        if (failed_) return Result<U>::fail(error_);
        if constexpr (std::is_void_v<U>) {
            f();
            return Result<void>::ok();
        } else {
            return Result<U>::ok(f());
        }
    }

    template <typename F>
    auto flat_map(F&& f) const -> std::invoke_result_t<F> {
        using R = std::invoke_result_t<F>;
        static_assert(detail::is_result<R>::value, "flat_map callback must return a Result");
        if (failed_) return R::fail(error_);
        return f();
    }

    template <typename OnOk, typename OnErr>
    auto fold(OnOk&& on_ok, OnErr&& on_err) const {
        return failed_ ? on_err(error_) : on_ok();
    }

    template <typename F>
    Result recover(F&& f) const {
        if (!failed_) return *this;
        f(error_);
        return Result::ok();
    }

private:
    Result() = default;

    Error error_;
    bool failed_ = false;
};

using VoidResult = Result<void>;

inline Error validation_error(std::string message) { return {ErrorKind::VALIDATION, std::move(message)}; }
inline Error not_found_error(std::string message) { return {ErrorKind::NOT_FOUND, std::move(message)}; }
inline Error conflict_error(std::string message) { return {ErrorKind::CONFLICT, std::move(message)}; }
inline Error access_denied_error(std::string message) { return {ErrorKind::ACCESS_DENIED, std::move(message)}; }
inline Error invalid_state_error(std::string message) { return {ErrorKind::INVALID_STATE, std::move(message)}; }

} // namespace funcmodel

#endif // FUNCMODEL_CORE_TYPES_RESULT_H
