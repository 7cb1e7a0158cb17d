#pragma once

#include <conflate/policies/conflation_policy.h>

#include <concepts>

namespace conflate {

/// Most recent write wins.
template<std::copy_constructible T>
class LastValuePolicy final : public ConflationPolicy<T, T> {
public:
    [[nodiscard]] T init(const T& value, NoRaw&) const override { return value; }

    [[nodiscard]] T merge(const T& value, const T&, NoRaw&) const override { return value; }

    [[nodiscard]] std::string_view name() const override { return "ConflatedDict"; }
};

} // namespace conflate
