#pragma once

#include <conflate/policies/conflation_policy.h>
#include <conflate/types/ohlc.h>
#include <conflate/types/value_ops.h>

namespace conflate {

/**
 * @brief Tracks the Open, High, Low and Close of the values written to a key.
 *
 * Close always takes the latest write, open keeps the first. The summary is carried across
 * reset(): a key written again in a later interval extends its previous OHLC.
 *
 * For AnyValue inputs the comparisons are checked at run time, a value that cannot be ordered
 * against the stored high/low raises type_mismatch and leaves the stored summary unchanged.
 */
template<orderable_value T>
class OhlcPolicy final : public ConflationPolicy<T, Ohlc<T>> {
public:
    using ops = value_ops<T>;

    [[nodiscard]] Ohlc<T> init(const T& value, NoRaw&) const override {
        return Ohlc<T>{value, value, value, value};
    }

    [[nodiscard]] Ohlc<T> merge(const T& value, const Ohlc<T>& current, NoRaw&) const override {
        if (ops::less(current.high, value)) {
            // New high and new close
            return Ohlc<T>{current.open, value, current.low, value};
        }
        if (ops::less(value, current.low)) {
            // New low and new close
            return Ohlc<T>{current.open, current.high, value, value};
        }
        return Ohlc<T>{current.open, current.high, current.low, value};
    }

    [[nodiscard]] std::string_view name() const override { return "OHLCConflator"; }
};

} // namespace conflate
