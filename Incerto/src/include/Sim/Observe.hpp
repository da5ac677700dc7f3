#pragma once

#include <type_traits>
#include <utility>
#include <vector>

namespace Incerto::Sim {

// Records handed to a reduction, one pointer per matching entity.
template<typename C>
using Records = std::vector<const C*>;

// ---------------------------------------------------------------------------
// Observation capabilities
//
// A record type opts in by specializing one of the templates below. The
// harness never inspects record fields itself and keeps no list of known
// types; Simulation dispatches on whichever specialization exists.
//
//   struct Counter { std::size_t value = 0; };
//
//   namespace Incerto::Sim {
//   template<> struct ManyObservable<Counter> {
//       using Out = std::size_t;
//       static Out Observe(const Records<Counter>& records) {
//           Out sum = 0;
//           for (const auto* c : records) sum += c->value;
//           return sum;
//       }
//   };
//   }
// ---------------------------------------------------------------------------

// Convert the one record of type C in the population into a result.
//   using Out = ...;  static Out Observe(const C&);
template<typename C>
struct SingleObservable {};

// Reduce a non-empty collection of C records into a result.
//   using Out = ...;  static Out Observe(const Records<C>&);
template<typename C>
struct ManyObservable {};

// Extract a value of type O from one record. A record type may have
// samplers for several O.
//   static O Sample(const C&);
template<typename C, typename O, typename = void>
struct Sampler {};

// Reduce a possibly empty collection of C records into an O.
//   static O Aggregate(const Records<C>&);
// Built-in statistics (see Aggregate.hpp) are partial specializations over
// any C that has a Sampler.
template<typename C, typename O, typename = void>
struct Aggregator {};

// ---------------------------------------------------------------------------
// Capability detection
// ---------------------------------------------------------------------------

template<typename C, typename = void>
struct IsSingleObservable : std::false_type {};
template<typename C>
struct IsSingleObservable<C, std::void_t<
    typename SingleObservable<C>::Out,
    decltype(SingleObservable<C>::Observe(std::declval<const C&>()))>> : std::true_type {};

template<typename C, typename = void>
struct IsManyObservable : std::false_type {};
template<typename C>
struct IsManyObservable<C, std::void_t<
    typename ManyObservable<C>::Out,
    decltype(ManyObservable<C>::Observe(std::declval<const Records<C>&>()))>> : std::true_type {};

template<typename C, typename O, typename = void>
struct IsSampleable : std::false_type {};
template<typename C, typename O>
struct IsSampleable<C, O, std::void_t<
    decltype(Sampler<C, O>::Sample(std::declval<const C&>()))>> : std::true_type {};

template<typename C, typename O, typename = void>
struct IsAggregatable : std::false_type {};
template<typename C, typename O>
struct IsAggregatable<C, O, std::void_t<
    decltype(Aggregator<C, O>::Aggregate(std::declval<const Records<C>&>()))>> : std::true_type {};

} // namespace Incerto::Sim
