#pragma once

#include <conflate/policies/conflation_policy.h>

#include <concepts>
#include <vector>

namespace conflate {

/**
 * @brief Collects every value written to a key during the interval, in write order.
 *
 * The conflated value is an owned copy of the buffer, so a batch handed to a consumer never
 * changes under it when the producer keeps writing. reset() empties the buffer and the next
 * write starts a fresh batch.
 */
template<std::copy_constructible T>
class BatchPolicy final : public ConflationPolicy<T, std::vector<T>, std::vector<T>> {
public:
    [[nodiscard]] std::vector<T> init(const T& value, std::vector<T>& raw) const override {
        raw.push_back(value);
        return raw;
    }

    [[nodiscard]] std::vector<T> merge(const T& value, const std::vector<T>&, std::vector<T>& raw) const override {
        raw.push_back(value);
        return raw;
    }

    void on_reset(std::vector<T>& raw) const override { raw.clear(); }

    [[nodiscard]] std::string_view name() const override { return "BatchConflator"; }
};

} // namespace conflate
