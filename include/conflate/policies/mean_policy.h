#pragma once

#include <conflate/policies/conflation_policy.h>
#include <conflate/types/value_ops.h>

#include <cstddef>

namespace conflate {

/// Running sum and sample count of the current interval.
struct MeanAccumulator {
    double sum{0.0};
    std::size_t count{0};

    friend bool operator==(const MeanAccumulator&, const MeanAccumulator&) = default;
};

/**
 * @brief Arithmetic mean of the values written to a key during the interval.
 *
 * The mean is always a double, whatever the numeric input type. reset() clears the accumulator,
 * so the first write of the next interval yields that value alone.
 */
template<numeric_value T>
class MeanPolicy final : public ConflationPolicy<T, double, MeanAccumulator> {
public:
    using ops = value_ops<T>;

    [[nodiscard]] double init(const T& value, MeanAccumulator& raw) const override {
        return accumulate(value, raw);
    }

    [[nodiscard]] double merge(const T& value, const double&, MeanAccumulator& raw) const override {
        return accumulate(value, raw);
    }

    void on_reset(MeanAccumulator& raw) const override { raw = MeanAccumulator{}; }

    [[nodiscard]] std::string_view name() const override { return "MeanConflator"; }

private:
    static double accumulate(const T& value, MeanAccumulator& raw) {
        const double x = ops::to_double(value);  // may throw, raw is untouched
        raw.sum += x;
        ++raw.count;
        return raw.sum / static_cast<double>(raw.count);
    }
};

} // namespace conflate
