//
// Created by gregorian on 02/03/2026.
//

#ifndef CILENS_CORE_RESULT_H
#define CILENS_CORE_RESULT_H

#include "cilens/core/error.h"
#include <source_location>
#include <optional>
#include <stdexcept>
#include <variant>

namespace cilens::core {

    /**
     * @brief Outcome of a fallible operation: either a value of type T or an Error.
     *
     * Used at the edges of the engine (ingestion, configuration, export, graph
     * resolution). The analytics core itself is total on well-typed input.
     *
     * @tparam T The type of the successful result value.
     */
    template<typename T>
    class Result {
    public:
        explicit Result(T value) : data_(std::move(value)) {}
        explicit Result(Error error) : data_(std::move(error)) {}

        static Result success(T value) { return Result(std::move(value)); }
        static Result failure(Error error) { return Result(std::move(error)); }

        /// Failure raised at the caller's location.
        static Result failure(const ErrorCode code, std::string message,
                              const std::source_location location = std::source_location::current()) {
            return Result(Error(code, std::move(message), location));
        }

        [[nodiscard]] bool is_success() const { return std::holds_alternative<T>(data_); }
        [[nodiscard]] bool is_failure() const { return std::holds_alternative<Error>(data_); }

        /// @return The contained value, or throws if this is a failure.
        const T& value() const & {
            if (!is_success()) throw std::runtime_error("Accessed value of failed Result");
            return std::get<T>(data_);
        }

        T&& value() && {
            if (!is_success()) throw std::runtime_error("Accessed value of failed Result");
            return std::move(std::get<T>(data_));
        }

        /// @return The contained error, or throws if this is a success.
        [[nodiscard]] const Error& error() const {
            if (!is_failure()) throw std::runtime_error("Accessed error of successful Result");
            return std::get<Error>(data_);
        }

        /**
         * @brief Applies @p func to the value if successful, propagating the error otherwise.
         */
        template<typename F>
        auto map(F&& func) const & -> Result<decltype(func(std::declval<const T&>()))> {
            using U = decltype(func(std::declval<const T&>()));
            if (is_success()) return Result<U>::success(func(std::get<T>(data_)));
            return Result<U>::failure(std::get<Error>(data_));
        }

        /**
         * @brief Rewrites the error with @p func, typically to attach context.
         *
         * A success passes through unchanged.
         */
        template<typename F>
        Result map_error(F&& func) && {
            if (is_success()) return std::move(*this);
            return Result(func(std::get<Error>(data_)));
        }

    private:
        std::variant<T, Error> data_;
    };

    /**
     * @brief Specialization for operations that succeed without a value.
     */
    template<>
    class Result<void> {
    public:
        Result() = default;
        explicit Result(Error error) : error_(std::move(error)) {}

        static Result success() { return {}; }
        static Result failure(Error error) { return Result(std::move(error)); }
        static Result failure(const ErrorCode code, std::string message,
                              const std::source_location location = std::source_location::current()) {
            return Result(Error(code, std::move(message), location));
        }

        [[nodiscard]] bool is_success() const { return !error_.has_value(); }
        [[nodiscard]] bool is_failure() const { return error_.has_value(); }

        [[nodiscard]] const Error& error() const {
            if (!is_failure()) throw std::runtime_error("Accessed error of successful Result");
            return *error_;
        }

    private:
        std::optional<Error> error_;
    };

}

#endif //CILENS_CORE_RESULT_H
