#pragma once

#include <conflate/policies/conflation_policy.h>

#include <concepts>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace conflate {

/**
 * @brief Conflates with a user supplied reducer f(value, past_values) -> conflated value.
 *
 * past_values holds the values written to the key earlier in the interval, in write order and
 * excluding the value being applied. The value is appended once f returns, so a throwing
 * reducer leaves the history untouched. reset() clears the history.
 *
 * @code
 * ReducerPolicy<int> running_total{[](const int& x, const std::vector<int>& past) {
 *     return std::accumulate(past.begin(), past.end(), x);
 * }, "RunningTotal"};
 * @endcode
 */
template<std::copy_constructible T, typename R = T>
class ReducerPolicy final : public ConflationPolicy<T, R, std::vector<T>> {
public:
    using reducer_type = std::function<R(const T&, const std::vector<T>&)>;

    explicit ReducerPolicy(reducer_type reducer, std::optional<std::string> name = std::nullopt)
        : reducer_(std::move(reducer)), name_(std::move(name)) {}

    [[nodiscard]] R init(const T& value, std::vector<T>& raw) const override {
        return apply(value, raw);
    }

    [[nodiscard]] R merge(const T& value, const R&, std::vector<T>& raw) const override {
        return apply(value, raw);
    }

    void on_reset(std::vector<T>& raw) const override { raw.clear(); }

    [[nodiscard]] std::string_view name() const override {
        return name_ ? std::string_view{*name_} : std::string_view{"LambdaConflator"};
    }

private:
    R apply(const T& value, std::vector<T>& raw) const {
        R result = reducer_(value, raw);
        raw.push_back(value);
        return result;
    }

    reducer_type reducer_;
    std::optional<std::string> name_;
};

} // namespace conflate
