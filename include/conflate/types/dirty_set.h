#pragma once

/**
 * @file dirty_set.h
 * @brief Container type aliases used for keyed conflation state.
 *
 * Centralises the hash containers behind the value store, the raw store and the dirty set so the
 * underlying implementation can be switched in one place. ankerl::unordered_dense keeps its
 * elements in a contiguous vector, which makes iteration over the dirty keys a linear scan and
 * lets ranges address elements by index.
 */

#include <ankerl/unordered_dense.h>

namespace conflate {

template<typename K, typename Hash = ankerl::unordered_dense::hash<K>>
using DirtySet = ankerl::unordered_dense::set<K, Hash>;

template<typename K, typename V, typename Hash = ankerl::unordered_dense::hash<K>>
using ValueStore = ankerl::unordered_dense::map<K, V, Hash>;

} // namespace conflate
