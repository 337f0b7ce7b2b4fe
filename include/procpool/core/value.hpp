#pragma once

/**
 * @file value.hpp
 * @brief Serializable argument and result values
 */

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "procpool/core/errors.hpp"

namespace procpool {

/**
 * @brief Timestamp type using steady clock for monotonic timing
 *
 * The steady clock is CLOCK_MONOTONIC on Linux, which every process on the
 * host shares, so worker timestamps are comparable with submitter ones.
 */
using Timestamp = std::chrono::steady_clock::time_point;

/**
 * @brief Opaque binary data
 */
using Blob = std::vector<std::byte>;

/**
 * @brief Values that can cross a process boundary
 *
 * Job arguments and results are restricted to this closed set so that every
 * job can be encoded into a pipe frame.
 */
using Value = std::variant<
    std::monostate,      // Unset / no value
    bool,
    std::int64_t,        // Every integral type except bool
    double,              // Every floating point type
    std::string,
    Blob
>;

/**
 * @brief Ordered job arguments
 */
using ValueList = std::vector<Value>;

/**
 * @brief Human-readable name of the alternative held by a value
 */
[[nodiscard]] const char* value_type_name(const Value& value) noexcept;

/**
 * @brief Render a value for log lines
 */
[[nodiscard]] std::string to_string(const Value& value);

/**
 * @brief True if T can be converted to and from a Value
 */
template<typename T>
inline constexpr bool is_value_type_v =
    std::is_same_v<std::decay_t<T>, bool>
    || std::is_integral_v<std::decay_t<T>>
    || std::is_floating_point_v<std::decay_t<T>>
    || std::is_same_v<std::decay_t<T>, std::string>
    || std::is_same_v<std::decay_t<T>, const char*>
    || std::is_same_v<std::decay_t<T>, char*>
    || std::is_same_v<std::decay_t<T>, Blob>
    || std::is_same_v<std::decay_t<T>, Value>
    || std::is_same_v<std::decay_t<T>, std::monostate>;

namespace detail {

/**
 * @brief True if an integral value is representable as To
 */
template<typename To, typename From>
constexpr bool fits_in(From value) noexcept {
    if constexpr (std::is_signed_v<From> == std::is_signed_v<To>) {
        return value >= std::numeric_limits<To>::min() && value <= std::numeric_limits<To>::max();
    } else if constexpr (std::is_signed_v<From>) {
        return value >= 0
            && static_cast<std::make_unsigned_t<From>>(value) <= std::numeric_limits<To>::max();
    } else {
        return value <= static_cast<std::make_unsigned_t<To>>(std::numeric_limits<To>::max());
    }
}

} // namespace detail

/**
 * @brief Convert a native value into a Value
 * @throws SerializationError for an unsigned value above INT64_MAX
 */
template<typename T>
[[nodiscard]] Value to_value(T&& value) {
    using U = std::decay_t<T>;
    static_assert(is_value_type_v<U>, "type cannot cross a process boundary");

    if constexpr (std::is_same_v<U, Value>) {
        return std::forward<T>(value);
    } else if constexpr (std::is_same_v<U, std::monostate>) {
        return Value{};
    } else if constexpr (std::is_same_v<U, bool>) {
        return Value{value};
    } else if constexpr (std::is_integral_v<U>) {
        if (!detail::fits_in<std::int64_t>(value)) {
            throw SerializationError("integer " + std::to_string(value) + " does not fit in int64");
        }
        return Value{static_cast<std::int64_t>(value)};
    } else if constexpr (std::is_floating_point_v<U>) {
        return Value{static_cast<double>(value)};
    } else if constexpr (std::is_same_v<U, const char*> || std::is_same_v<U, char*>) {
        return Value{std::string{value}};
    } else {
        return Value{std::forward<T>(value)};
    }
}

/**
 * @brief Convert a Value back into a native value
 * @throws SerializationError if the value holds a different alternative, or
 *         an integer out of range for T
 */
template<typename T>
[[nodiscard]] T from_value(const Value& value) {
    static_assert(is_value_type_v<T>, "type cannot cross a process boundary");
    static_assert(!std::is_pointer_v<T>, "convert strings to std::string");

    if constexpr (std::is_same_v<T, Value>) {
        return value;
    } else if constexpr (std::is_same_v<T, std::monostate>) {
        return std::monostate{};
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const auto* v = std::get_if<bool>(&value)) {
            return *v;
        }
    } else if constexpr (std::is_integral_v<T>) {
        if (const auto* v = std::get_if<std::int64_t>(&value)) {
            if (!detail::fits_in<T>(*v)) {
                throw SerializationError("integer " + std::to_string(*v) + " out of range for target type");
            }
            return static_cast<T>(*v);
        }
    } else if constexpr (std::is_floating_point_v<T>) {
        if (const auto* v = std::get_if<double>(&value)) {
            return static_cast<T>(*v);
        }
        if (const auto* v = std::get_if<std::int64_t>(&value)) {
            return static_cast<T>(*v);
        }
    } else {
        if (const auto* v = std::get_if<T>(&value)) {
            return *v;
        }
    }

    throw SerializationError(
        std::string("cannot convert value of type ") + value_type_name(value)
    );
}

} // namespace procpool
