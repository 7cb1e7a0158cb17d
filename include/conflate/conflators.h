#pragma once

/**
 * @file conflators.h
 * @brief Ready-made conflators, one per policy.
 *
 * The value type defaults to AnyValue<>, which accepts loosely typed streams and reports
 * unsupported operations as type_mismatch at run time. Pass a concrete value type to have the
 * same checks done at compile time.
 *
 * @code
 * conflate::OHLCConflator<std::string, double> prices;
 * prices.set("AAPL", 101.5);
 * prices.set("AAPL", 102.0);
 * for (const auto& [symbol, bar] : prices.items()) { ... }
 * prices.reset();
 * @endcode
 */

#include <conflate/conflated_container.h>
#include <conflate/policies/batch_policy.h>
#include <conflate/policies/last_value_policy.h>
#include <conflate/policies/mean_policy.h>
#include <conflate/policies/mode_policy.h>
#include <conflate/policies/ohlc_policy.h>
#include <conflate/policies/reducer_policy.h>
#include <conflate/types/any_value.h>

namespace conflate {

template<typename K, typename T = AnyValue<>>
using ConflatedDict = ConflatedContainer<K, LastValuePolicy<T>>;

template<typename K, typename T = AnyValue<>>
using OHLCConflator = ConflatedContainer<K, OhlcPolicy<T>>;

template<typename K, typename T = AnyValue<>>
using MeanConflator = ConflatedContainer<K, MeanPolicy<T>>;

template<typename K, typename T = AnyValue<>>
using BatchConflator = ConflatedContainer<K, BatchPolicy<T>>;

template<typename K, typename T = AnyValue<>>
using ModeConflator = ConflatedContainer<K, ModePolicy<T>>;

template<typename K, typename T = AnyValue<>, typename R = T>
using LambdaConflator = ConflatedContainer<K, ReducerPolicy<T, R>>;

} // namespace conflate
