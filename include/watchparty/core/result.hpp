// WatchParty - Watch-party signaling and process supervision core
// Result type for error handling without exceptions

#ifndef WATCHPARTY_CORE_RESULT_HPP
#define WATCHPARTY_CORE_RESULT_HPP

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace watchparty {
namespace core {

/**
 * @brief Either a success value or an error.
 *
 * Every fallible operation in WatchParty returns a Result instead of
 * throwing. Accessing the wrong alternative throws std::logic_error,
 * which always indicates a programming error at the call site.
 *
 * @tparam T The success value type
 * @tparam E The error type
 */
template<typename T, typename E>
class Result {
public:
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    static Result error(E err) {
        return Result(std::in_place_index<1>, std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return storage_.index() == 0;
    }

    [[nodiscard]] bool isError() const noexcept {
        return storage_.index() == 1;
    }

    /**
     * @brief Get the success value.
     * @throws std::logic_error if called on an error result
     */
    [[nodiscard]] T& value() & {
        requireSuccess();
        return std::get<0>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        requireSuccess();
        return std::get<0>(storage_);
    }

    [[nodiscard]] T&& value() && {
        requireSuccess();
        return std::get<0>(std::move(storage_));
    }

    /**
     * @brief Get the error value.
     * @throws std::logic_error if called on a success result
     */
    [[nodiscard]] E& error() & {
        requireError();
        return std::get<1>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        requireError();
        return std::get<1>(storage_);
    }

    /**
     * @brief Get the success value, or a fallback on error.
     */
    [[nodiscard]] T valueOr(T defaultValue) const& {
        return isSuccess() ? std::get<0>(storage_) : std::move(defaultValue);
    }

    [[nodiscard]] T valueOr(T defaultValue) && {
        return isSuccess() ? std::get<0>(std::move(storage_)) : std::move(defaultValue);
    }

    /**
     * @brief Convert the error alternative, keeping the success value.
     *
     * Used where a lower layer's error type (e.g. pal::NetworkError) is
     * surfaced through a higher layer's error type.
     *
     * @param fn Callable taking const E& and returning the new error
     */
    template<typename F>
    [[nodiscard]] auto mapError(F&& fn) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using Mapped = Result<T, std::invoke_result_t<F, const E&>>;
        if (isSuccess()) {
            return Mapped::success(std::get<0>(storage_));
        }
        return Mapped::error(std::forward<F>(fn)(std::get<1>(storage_)));
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v)
        : storage_(tag, std::forward<V>(v)) {}

    void requireSuccess() const {
        if (!isSuccess()) {
            throw std::logic_error("Attempted to access value on error result");
        }
    }

    void requireError() const {
        if (!isError()) {
            throw std::logic_error("Attempted to access error on success result");
        }
    }

    // Index 0 holds the value, index 1 the error; T and E may be the same type.
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that produce no value on success.
 *
 * @tparam E The error type
 */
template<typename E>
class Result<void, E> {
public:
    static Result success() {
        return Result();
    }

    static Result error(E err) {
        return Result(std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return isSuccessFlag_;
    }

    [[nodiscard]] bool isError() const noexcept {
        return !isSuccessFlag_;
    }

    /**
     * @brief Get the error value.
     * @throws std::logic_error if called on a success result
     */
    [[nodiscard]] E& error() & {
        if (isSuccessFlag_) {
            throw std::logic_error("Attempted to access error on success result");
        }
        return error_;
    }

    [[nodiscard]] const E& error() const& {
        if (isSuccessFlag_) {
            throw std::logic_error("Attempted to access error on success result");
        }
        return error_;
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    Result()
        : error_{}, isSuccessFlag_(true) {}

    explicit Result(E err)
        : error_(std::move(err)), isSuccessFlag_(false) {}

    E error_;
    bool isSuccessFlag_;
};

} // namespace core
} // namespace watchparty

#endif // WATCHPARTY_CORE_RESULT_HPP
