#pragma once

/**
 * @file ohlc.h
 * @brief Open/High/Low/Close summary of the values observed for a key.
 */

#include <fmt/format.h>

#include <string>

namespace conflate {

template<typename T>
struct Ohlc {
    T open;
    T high;
    T low;
    T close;

    friend bool operator==(const Ohlc& a, const Ohlc& b) {
        return a.open == b.open && a.high == b.high && a.low == b.low && a.close == b.close;
    }

    friend bool operator!=(const Ohlc& a, const Ohlc& b) { return !(a == b); }
};

template<typename T>
std::string to_string(const Ohlc<T>& v) {
    return fmt::format("ohlc(open={}, high={}, low={}, close={})", v.open, v.high, v.low, v.close);
}

} // namespace conflate

template<typename T>
struct fmt::formatter<conflate::Ohlc<T>> : fmt::formatter<std::string_view> {
    auto format(const conflate::Ohlc<T>& v, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(conflate::to_string(v), ctx);
    }
};
