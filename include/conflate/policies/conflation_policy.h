#pragma once

/**
 * @file conflation_policy.h
 * @brief ConflationPolicy - the strategy interface shared by all conflators.
 *
 * A policy decides how repeated writes to one key collapse into a single value. It owns no
 * per-key data: the container stores the conflated value and the policy's raw (auxiliary)
 * state for each key and hands them back on the next write.
 *
 * Protocol:
 * - init: first write for a key, fills a default constructed raw state
 * - merge: later writes, combines the new input with the stored value and raw state
 * - on_reset: called by the container for every key whose dirty flag is cleared
 * - name: label used by describe() and string rendering
 *
 * Exception guarantee: init and merge must validate the input before modifying the raw
 * state. A policy that throws leaves the raw state untouched, which lets the container
 * offer the strong guarantee on set().
 */

#include <concepts>
#include <string_view>
#include <type_traits>

namespace conflate {

/// Raw state of policies that need nothing besides the conflated value.
struct NoRaw {
    friend bool operator==(const NoRaw&, const NoRaw&) noexcept { return true; }
};

template<typename In, typename Out, typename Raw = NoRaw>
class ConflationPolicy {
public:
    using input_type = In;
    using value_type = Out;
    using raw_type = Raw;

    virtual ~ConflationPolicy() = default;

    /**
     * @brief Conflated value for the first write of a key.
     * @param value The written value
     * @param raw Default constructed raw state to populate
     */
    [[nodiscard]] virtual Out init(const In& value, Raw& raw) const = 0;

    /**
     * @brief Conflated value after a further write of a key.
     *
     * The current value may be a stale one retained from an earlier interval, the raw
     * state has been through on_reset() in that case.
     *
     * @param value The written value
     * @param current The stored conflated value
     * @param raw The stored raw state, updated in place
     */
    [[nodiscard]] virtual Out merge(const In& value, const Out& current, Raw& raw) const = 0;

    /**
     * @brief Interval boundary hook, invoked unconditionally by reset().
     *
     * The default keeps the raw state, policies that restart every interval clear it here.
     */
    virtual void on_reset(Raw& raw) const { (void)raw; }

    [[nodiscard]] virtual std::string_view name() const = 0;

protected:
    ConflationPolicy() = default;
    ConflationPolicy(const ConflationPolicy&) = default;
    ConflationPolicy(ConflationPolicy&&) noexcept = default;
    ConflationPolicy& operator=(const ConflationPolicy&) = default;
    ConflationPolicy& operator=(ConflationPolicy&&) noexcept = default;
};

/// A concrete policy usable by ConflatedContainer.
template<typename P>
concept conflation_policy =
    std::copy_constructible<P> &&
    std::derived_from<P, ConflationPolicy<typename P::input_type, typename P::value_type, typename P::raw_type>> &&
    std::default_initializable<typename P::raw_type>;

} // namespace conflate
