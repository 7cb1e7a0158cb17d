#pragma once

/**
 * @file value_ops.h
 * @brief Value operations the policies rely on, resolved per value type.
 *
 * Statically typed values get their operations from the language (operator<, arithmetic
 * conversion) and unsupported types are rejected at compile time by the concepts below.
 * AnyValue performs the same operations at run time and throws type_mismatch instead.
 */

#include <conflate/types/any_value.h>

#include <concepts>
#include <type_traits>

namespace conflate {

template<typename T>
struct value_ops {
    static bool less(const T& lhs, const T& rhs) requires std::totally_ordered<T> {
        return lhs < rhs;
    }

    static double to_double(const T& value) requires (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>) {
        return static_cast<double>(value);
    }
};

template<std::size_t SBO, std::size_t Align>
struct value_ops<AnyValue<SBO, Align>> {
    static bool less(const AnyValue<SBO, Align>& lhs, const AnyValue<SBO, Align>& rhs) {
        return lhs < rhs;
    }

    static double to_double(const AnyValue<SBO, Align>& value) {
        return value.to_double();
    }
};

/// Values an OHLC policy can track: the high and low need a strict ordering.
template<typename T>
concept orderable_value = std::copy_constructible<T> && requires(const T& a, const T& b) {
    { value_ops<T>::less(a, b) } -> std::convertible_to<bool>;
};

/// Values a mean policy can accumulate.
template<typename T>
concept numeric_value = requires(const T& v) {
    { value_ops<T>::to_double(v) } -> std::convertible_to<double>;
};

/// Values that can be counted by frequency (hash + equality).
template<typename T>
concept countable_value = std::copy_constructible<T> && std::equality_comparable<T> && requires(const T& v) {
    { std::hash<T>{}(v) } -> std::convertible_to<std::size_t>;
};

} // namespace conflate
