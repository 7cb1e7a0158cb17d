#pragma once

#include <conflate/policies/conflation_policy.h>
#include <conflate/types/dirty_set.h>
#include <conflate/types/value_ops.h>

#include <fmt/format.h>

#include <cstddef>
#include <string>

namespace conflate {

/// Most frequent value of the interval and how often it was written.
template<typename T>
struct ModeResult {
    T value;
    std::size_t count{0};

    friend bool operator==(const ModeResult& a, const ModeResult& b) {
        return a.count == b.count && a.value == b.value;
    }

    friend bool operator!=(const ModeResult& a, const ModeResult& b) { return !(a == b); }
};

/**
 * @brief Frequency counter of one key.
 *
 * counts keeps values in first-seen order (unordered_dense stores entries contiguously and is only
 * ever appended to), best_slot indexes the current mode inside it.
 */
template<typename T>
struct ModeCounter {
    ValueStore<T, std::size_t> counts;
    std::size_t best_slot{0};
    std::size_t best_count{0};
};

/**
 * @brief Reports the most frequently written value of the interval.
 *
 * Ties are broken deterministically: the first value to reach the maximum count keeps the mode
 * until another value strictly exceeds it. Writes 1, 2, 2, 1 therefore report (2, 2).
 * reset() clears the counter.
 */
template<countable_value T>
class ModePolicy final : public ConflationPolicy<T, ModeResult<T>, ModeCounter<T>> {
public:
    [[nodiscard]] ModeResult<T> init(const T& value, ModeCounter<T>& raw) const override {
        return count(value, raw);
    }

    [[nodiscard]] ModeResult<T> merge(const T& value, const ModeResult<T>&, ModeCounter<T>& raw) const override {
        return count(value, raw);
    }

    void on_reset(ModeCounter<T>& raw) const override {
        raw.counts.clear();
        raw.best_slot = 0;
        raw.best_count = 0;
    }

    [[nodiscard]] std::string_view name() const override { return "ModeConflator"; }

private:
    static ModeResult<T> count(const T& value, ModeCounter<T>& raw) {
        auto [it, inserted] = raw.counts.try_emplace(value, 0);
        const std::size_t n = ++it->second;
        if (n > raw.best_count) {
            raw.best_count = n;
            raw.best_slot = static_cast<std::size_t>(it - raw.counts.begin());
        }
        return ModeResult<T>{raw.counts.values()[raw.best_slot].first, raw.best_count};
    }
};

template<typename T>
std::string to_string(const ModeResult<T>& v) {
    return fmt::format("mode(value={}, count={})", v.value, v.count);
}

} // namespace conflate

template<typename T>
struct fmt::formatter<conflate::ModeResult<T>> : fmt::formatter<std::string_view> {
    auto format(const conflate::ModeResult<T>& v, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(conflate::to_string(v), ctx);
    }
};
