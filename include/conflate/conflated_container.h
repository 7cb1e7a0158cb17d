#pragma once

/**
 * @file conflated_container.h
 * @brief ConflatedContainer - keyed store that conflates writes and tracks dirty keys.
 *
 * Producers write (key, value) pairs at their own rate; a consumer periodically drains the keys
 * written since the previous drain and calls reset() to start the next interval. How repeated
 * writes of one key collapse is decided by the policy (see conflation_policy.h).
 *
 * Key design principles:
 * - Read operations (get, keys, values, items) only see dirty keys
 * - Values of clean keys are retained and remain inspectable through data()
 * - A write to a retained (clean) key merges into the retained value; the policy's on_reset()
 *   decides what auxiliary state survives the interval boundary
 * - set() offers the strong guarantee: a throwing policy leaves the container unchanged
 *
 * The container has no internal locking. When producer and consumer run on different threads the
 * host must serialise set() against the drain-then-reset sequence.
 */

#include <conflate/policies/conflation_policy.h>
#include <conflate/runtime/observers/conflation_observer.h>
#include <conflate/types/container_summary.h>
#include <conflate/types/dirty_set.h>
#include <conflate/util/errors.h>
#include <conflate/util/string_utils.h>

#include <cstddef>
#include <iterator>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace conflate {

/**
 * @brief Iterator over a snapshot of dirty keys, projected to key, value or item.
 *
 * Value and item projections look the key up in the container when dereferenced and step over
 * keys erased since the snapshot was taken.
 */
template<typename Container, typename Key, typename Projection>
class DirtyIterator {
public:
    using reference = decltype(Projection{}(std::declval<const Container&>(), std::declval<const Key&>()));
    using value_type = std::remove_cvref_t<reference>;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using iterator_category =
        std::conditional_t<std::is_reference_v<reference>, std::forward_iterator_tag, std::input_iterator_tag>;

    DirtyIterator() noexcept = default;

    DirtyIterator(const Container* container, const std::vector<Key>* keys, std::size_t index)
        : container_(container)
        , keys_(keys)
        , index_(index)
    {
        skip_missing();
    }

    reference operator*() const { return Projection{}(*container_, (*keys_)[index_]); }

    DirtyIterator& operator++() {
        ++index_;
        skip_missing();
        return *this;
    }

    DirtyIterator operator++(int) {
        DirtyIterator tmp = *this;
        ++(*this);
        return tmp;
    }

    bool operator==(const DirtyIterator& other) const noexcept {
        return index_ == other.index_;
    }

    bool operator!=(const DirtyIterator& other) const noexcept {
        return !(*this == other);
    }

private:
    void skip_missing() {
        while (index_ < keys_->size() && !Projection::available(*container_, (*keys_)[index_])) {
            ++index_;
        }
    }

    const Container* container_{nullptr};
    const std::vector<Key>* keys_{nullptr};
    std::size_t index_{0};
};

/**
 * @brief Range over the keys that were dirty when the range was created.
 *
 * The keys are copied at creation, so the container may be modified while iterating (erasing
 * each key as it is drained, for instance). Values are read when dereferenced. begin() may be
 * called again to walk the same snapshot; call keys()/values()/items() again for a fresh one.
 *
 * @code
 * for (const auto& [key, value] : conflator.items()) {
 *     publish(key, value);
 * }
 * conflator.reset();
 * @endcode
 */
template<typename Container, typename Key, typename Projection>
class DirtyRange {
public:
    using iterator = DirtyIterator<Container, Key, Projection>;

    DirtyRange(const Container& container, std::vector<Key> keys)
        : container_(&container)
        , keys_(std::move(keys))
    {}

    [[nodiscard]] iterator begin() const { return iterator(container_, &keys_, 0); }
    [[nodiscard]] iterator end() const { return iterator(container_, &keys_, keys_.size()); }

    /// Number of keys in the snapshot.
    [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }
    [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }

private:
    const Container* container_;
    std::vector<Key> keys_;
};

template<typename K, conflation_policy Policy, typename Hash = ankerl::unordered_dense::hash<K>>
class ConflatedContainer {
public:
    using key_type = K;
    using policy_type = Policy;
    using input_type = typename Policy::input_type;
    using value_type = typename Policy::value_type;
    using raw_type = typename Policy::raw_type;
    using interface_type = ConflationPolicy<input_type, value_type, raw_type>;
    using data_type = ValueStore<K, value_type, Hash>;
    using raw_store_type = ValueStore<K, raw_type, Hash>;
    using dirty_set_type = DirtySet<K, Hash>;

    struct key_projection {
        const K& operator()(const ConflatedContainer&, const K& key) const { return key; }
        static bool available(const ConflatedContainer&, const K&) { return true; }
    };

    struct value_projection {
        const value_type& operator()(const ConflatedContainer& c, const K& key) const {
            return c.data_.find(key)->second;
        }
        static bool available(const ConflatedContainer& c, const K& key) { return c.data_.contains(key); }
    };

    struct item_projection {
        std::pair<const K&, const value_type&> operator()(const ConflatedContainer& c, const K& key) const {
            return {key, c.data_.find(key)->second};
        }
        static bool available(const ConflatedContainer& c, const K& key) { return c.data_.contains(key); }
    };

    using key_range = DirtyRange<ConflatedContainer, K, key_projection>;
    using value_range = DirtyRange<ConflatedContainer, K, value_projection>;
    using item_range = DirtyRange<ConflatedContainer, K, item_projection>;

    ConflatedContainer() requires std::default_initializable<Policy> = default;

    explicit ConflatedContainer(Policy policy, ConflationObserver::ptr observer = nullptr)
        : policy_(std::move(policy))
        , observer_(observer)
    {}

    explicit ConflatedContainer(ConflationObserver::ptr observer) requires std::default_initializable<Policy>
        : observer_(observer)
    {}

    // ========== Writes ==========

    /**
     * @brief Conflate value into key and mark key dirty.
     *
     * An unseen key is initialised by the policy, a retained key (dirty or clean) is merged.
     * @throws type_mismatch when the policy cannot process value; nothing is modified then
     */
    void set(const K& key, const input_type& value) {
        const interface_type& policy = policy_;
        if (auto it = data_.find(key); it != data_.end()) {
            raw_type& raw = raw_[key];
            it->second = policy.merge(value, it->second, raw);
        } else {
            raw_type raw{};
            value_type conflated = policy.init(value, raw);
            data_.emplace(key, std::move(conflated));
            raw_.insert_or_assign(key, std::move(raw));
        }
        dirty_.insert(key);
        if (observer_) observer_->on_after_set(describe(), to_display_string(key));
    }

    /**
     * @brief Remove a dirty key together with its value and raw state.
     * @throws key_not_found if key is absent or not dirty
     */
    void erase(const K& key) {
        if (!dirty_.contains(key)) {
            throw_error<key_not_found>("{}: cannot erase key {}, it is not dirty", policy_name(),
                                       to_display_string(key));
        }
        dirty_.erase(key);
        data_.erase(key);
        raw_.erase(key);
        if (observer_) observer_->on_after_erase(describe(), to_display_string(key));
    }

    /**
     * @brief End the interval: no key is dirty afterwards.
     *
     * Values are retained; the policy's on_reset() is applied to the raw state of every key that
     * was dirty (clean keys went through it at an earlier reset).
     */
    void reset() {
        const interface_type& policy = policy_;
        const std::size_t released = dirty_.size();
        for (const K& key : dirty_.values()) {
            if (auto it = raw_.find(key); it != raw_.end()) {
                policy.on_reset(it->second);
            }
        }
        dirty_.clear();
        if (observer_) observer_->on_after_reset(describe(), released);
    }

    /// Drop everything, dirty and retained.
    void clear() {
        dirty_.clear();
        data_.clear();
        raw_.clear();
        if (observer_) observer_->on_after_clear(describe());
    }

    // ========== Reads ==========

    /**
     * @brief Copy of the conflated value of a dirty key.
     * @throws key_not_dirty if key was never written or has not been written since the last reset
     */
    [[nodiscard]] value_type get(const K& key) const {
        if (!dirty_.contains(key)) {
            if (data_.contains(key)) {
                throw_error<key_not_dirty>("{}: key {} not found in dirty set (not written since reset)",
                                           policy_name(), to_display_string(key));
            }
            throw_error<key_not_dirty>("{}: key {} not found in dirty set (never written)", policy_name(),
                                       to_display_string(key));
        }
        return data_.find(key)->second;
    }

    [[nodiscard]] bool contains(const K& key) const { return dirty_.contains(key); }
    [[nodiscard]] bool is_dirty(const K& key) const { return dirty_.contains(key); }

    /// Number of dirty keys.
    [[nodiscard]] std::size_t size() const noexcept { return dirty_.size(); }
    [[nodiscard]] bool empty() const noexcept { return dirty_.empty(); }

    [[nodiscard]] key_range keys() const { return key_range(*this, dirty_keys()); }
    [[nodiscard]] value_range values() const { return value_range(*this, dirty_keys()); }
    [[nodiscard]] item_range items() const { return item_range(*this, dirty_keys()); }

    /// Every retained value, dirty or not. Not filtered by the dirty set.
    [[nodiscard]] const data_type& data() const noexcept { return data_; }

    [[nodiscard]] ContainerSummary describe() const {
        return ContainerSummary{std::string(policy_name()), dirty_.size(), data_.size()};
    }

    [[nodiscard]] const Policy& policy() const noexcept { return policy_; }

    [[nodiscard]] ConflationObserver::ptr observer() const noexcept { return observer_; }
    void set_observer(ConflationObserver::ptr observer) noexcept { observer_ = observer; }

private:
    [[nodiscard]] std::vector<K> dirty_keys() const {
        return std::vector<K>(dirty_.values().begin(), dirty_.values().end());
    }

    [[nodiscard]] std::string_view policy_name() const {
        const interface_type& policy = policy_;
        return policy.name();
    }

    Policy policy_;
    ConflationObserver::ptr observer_{nullptr};
    data_type data_;
    raw_store_type raw_;
    dirty_set_type dirty_;
};

template<typename K, typename Policy, typename Hash>
std::string to_string(const ConflatedContainer<K, Policy, Hash>& container) {
    return to_string(container.describe());
}

} // namespace conflate
