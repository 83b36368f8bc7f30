// Adapters.hpp - Container shape detection used to classify property value types
#pragma once

#include <NGIN/Containers/Vector.hpp>

#include <deque>
#include <list>
#include <map>
#include <optional>
#include <set>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Propel::Properties::Adapters {

// Sequence detection (std::vector, std::deque, std::list, NGIN::Containers::Vector)
template<class T>
struct is_sequence : std::false_type {};

template<class T, class A>
struct is_sequence<std::vector<T, A>> : std::true_type { using element_type = T; };

template<class T, class A>
struct is_sequence<std::deque<T, A>> : std::true_type { using element_type = T; };

template<class T, class A>
struct is_sequence<std::list<T, A>> : std::true_type { using element_type = T; };

template<class T, class Alloc>
struct is_sequence<NGIN::Containers::Vector<T, Alloc>> : std::true_type { using element_type = T; };

template<class T>
inline constexpr bool is_sequence_v = is_sequence<T>::value;

// Unique-element sets
template<class T>
struct is_set : std::false_type {};

template<class K, class C, class A>
struct is_set<std::set<K, C, A>> : std::true_type { using element_type = K; };

template<class K, class H, class E, class A>
struct is_set<std::unordered_set<K, H, E, A>> : std::true_type { using element_type = K; };

template<class T>
inline constexpr bool is_set_v = is_set<T>::value;

// Associative maps
template<class T>
struct is_map : std::false_type {};

template<class K, class V, class C, class A>
struct is_map<std::map<K, V, C, A>> : std::true_type {
  using key_type = K;
  using mapped_type = V;
};

template<class K, class V, class H, class E, class A>
struct is_map<std::unordered_map<K, V, H, E, A>> : std::true_type {
  using key_type = K;
  using mapped_type = V;
};

template<class T>
inline constexpr bool is_map_v = is_map<T>::value;

// Optional detection; an empty optional reads as "no value".
template<class T>
struct is_optional : std::false_type {};

template<class T>
struct is_optional<std::optional<T>> : std::true_type { using value_type = T; };

template<class T>
inline constexpr bool is_optional_v = is_optional<T>::value;

} // namespace Propel::Properties::Adapters
