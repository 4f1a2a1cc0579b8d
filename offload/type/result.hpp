/*
 * result.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-3

Description: Result type for operations with an expected failure mode

**************************************************/

#ifndef OFFLOAD_TYPE_RESULT_HPP
#define OFFLOAD_TYPE_RESULT_HPP

#include <concepts>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace offload::type {

/**
 * @brief Tagged error value used to construct a failed Result.
 * @tparam E The error type.
 */
template <typename E>
struct Failure {
    E error;
};

template <typename E>
Failure(E) -> Failure<E>;

/**
 * @brief Helper to build a Failure without spelling the type.
 */
template <typename E>
[[nodiscard]] auto fail(E&& error) -> Failure<std::decay_t<E>> {
    return Failure<std::decay_t<E>>{std::forward<E>(error)};
}

/**
 * @brief Template for operation results, alternative to exceptions.
 * @tparam T The type of the successful result value.
 * @tparam E The type of the error value.
 */
template <typename T, typename E = std::string>
class Result {
private:
    std::variant<T, E> data_;  ///< Holds either the success value or an error.

public:
    /**
     * @brief Constructs a Result with a success value.
     * @param value The success value.
     */
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    /**
     * @brief Constructs a Result holding an error.
     * @param failure The error wrapper.
     */
    template <typename U>
        requires std::constructible_from<E, U>
    Result(Failure<U> failure)
        : data_(std::in_place_index<1>, std::move(failure.error)) {}

    /**
     * @brief Checks if the result represents success.
     */
    [[nodiscard]] bool isSuccess() const noexcept { return data_.index() == 0; }

    /**
     * @brief Checks if the result represents an error.
     */
    [[nodiscard]] bool isError() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return isSuccess(); }

    /**
     * @brief Gets the success value.
     * @throws std::logic_error if the result is an error.
     */
    [[nodiscard]] const T& value() const& {
        if (isError()) {
            throw std::logic_error(
                "Attempted to access value of an error Result");
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T&& value() && {
        if (isError()) {
            throw std::logic_error(
                "Attempted to access value of an error Result");
        }
        return std::move(std::get<0>(data_));
    }

    /**
     * @brief Gets the error value.
     * @throws std::logic_error if the result is successful.
     */
    [[nodiscard]] const E& error() const {
        if (isSuccess()) {
            throw std::logic_error(
                "Attempted to access error of a success Result");
        }
        return std::get<1>(data_);
    }
};

/**
 * @brief Specialization for operations that produce no value.
 */
template <typename E>
class Result<void, E> {
private:
    std::optional<E> error_;

public:
    Result() = default;

    template <typename U>
        requires std::constructible_from<E, U>
    Result(Failure<U> failure) : error_(std::move(failure.error)) {}

    [[nodiscard]] bool isSuccess() const noexcept { return !error_; }
    [[nodiscard]] bool isError() const noexcept { return error_.has_value(); }

    explicit operator bool() const noexcept { return isSuccess(); }

    [[nodiscard]] const E& error() const {
        if (isSuccess()) {
            throw std::logic_error(
                "Attempted to access error of a success Result");
        }
        return *error_;
    }
};

}  // namespace offload::type

#endif  // OFFLOAD_TYPE_RESULT_HPP
