/**
 * @file Result.hpp
 * @brief Value-or-error return type used by every patch step
 *
 * Parser, reconciliation engine and patch functions report failures by
 * returning a PatchError inside a Result instead of throwing. Callers that
 * prefer exceptions can call value(), which throws PatchFailure on error.
 *
 * Example:
 * ```cpp
 * auto parsed = parse_key_path("tags[1]");
 * if (!parsed) {
 *     std::cerr << parsed.error().message() << "\n";
 *     return;
 * }
 * for (const auto& component : *parsed) { ... }
 * ```
 */

#ifndef PATHPATCH_RESULT_HPP
#define PATHPATCH_RESULT_HPP

#include "pathpatch/Errors.hpp"
#include <optional>
#include <utility>
#include <variant>

namespace pathpatch {

/**
 * @brief Holds either a T or a PatchError
 */
template <typename T>
class Result {
public:
    Result(const T& value) : state_(std::in_place_index<0>, value) {}
    Result(T&& value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(const PatchError& error) : state_(std::in_place_index<1>, error) {}
    Result(PatchError&& error) : state_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    /**
     * @brief Access the value
     * @throws PatchFailure if the result holds an error
     */
    T& value() & {
        throw_if_error();
        return std::get<0>(state_);
    }

    const T& value() const& {
        throw_if_error();
        return std::get<0>(state_);
    }

    T&& value() && {
        throw_if_error();
        return std::move(std::get<0>(state_));
    }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    /**
     * @brief Access the error
     * @pre !ok()
     */
    const PatchError& error() const { return std::get<1>(state_); }

private:
    void throw_if_error() const {
        if (!ok()) {
            throw PatchFailure(std::get<1>(state_));
        }
    }

    std::variant<T, PatchError> state_;
};

/**
 * @brief Success-or-error result of an operation with no value
 */
template <>
class Result<void> {
public:
    Result() = default;
    Result(const PatchError& error) : error_(error) {}
    Result(PatchError&& error) : error_(std::move(error)) {}

    bool ok() const noexcept { return !error_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    /**
     * @brief Throw if the operation failed
     * @throws PatchFailure if the result holds an error
     */
    void value() const {
        if (error_) {
            throw PatchFailure(*error_);
        }
    }

    /**
     * @brief Access the error
     * @pre !ok()
     */
    const PatchError& error() const { return *error_; }

private:
    std::optional<PatchError> error_;
};

} // namespace pathpatch

#endif // PATHPATCH_RESULT_HPP
