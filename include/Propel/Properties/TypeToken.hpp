// TypeToken.hpp
// Static per-type descriptions: name, stable id, category and nested argument types
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <cstdint>
#include <string_view>
#include <type_traits>

#include <Propel/Properties/Types.hpp>
#include <Propel/Properties/Adapters.hpp>
#include <Propel/Properties/Observable.hpp>

namespace Propel::Properties
{

  enum class TypeCategory : NGIN::UInt8
  {
    Void = 0,
    Int = 1,    // int
    Long = 2,   // std::int64_t
    Double = 3, // double
    Object = 4,
    List = 5,
    Set = 6,
    Map = 7,
    Optional = 8,
    ReadOnlyObservable = 9,
    Observable = 10,
  };

  // Immutable description of a C++ type. One instance per type, so tokens compare by address.
  struct TypeToken
  {
    std::string_view name{};
    TypeId id{0};
    TypeCategory category{TypeCategory::Object};
    // List/Set element type.
    const TypeToken *element{nullptr};
    // Map key type.
    const TypeToken *key{nullptr};
    // Map value type, Optional payload, or the value held by an observable box.
    const TypeToken *value{nullptr};
  };

  namespace detail
  {
    // Compute FNV-based type id for a type
    template <class T>
    inline NGIN::UInt64 TypeIdOf()
    {
      auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }

    template <class T>
    constexpr TypeCategory CategoryOf() noexcept
    {
      using U = std::remove_cvref_t<T>;
      if constexpr (std::is_void_v<U>)
        return TypeCategory::Void;
      else if constexpr (std::is_same_v<U, int>)
        return TypeCategory::Int;
      else if constexpr (std::is_same_v<U, std::int64_t>)
        return TypeCategory::Long;
      else if constexpr (std::is_same_v<U, double>)
        return TypeCategory::Double;
      else if constexpr (Adapters::is_optional_v<U>)
        return TypeCategory::Optional;
      else if constexpr (IsObservableV<U>)
        return TypeCategory::Observable;
      else if constexpr (IsReadOnlyObservableV<U>)
        return TypeCategory::ReadOnlyObservable;
      else if constexpr (Adapters::is_sequence_v<U>)
        return TypeCategory::List;
      else if constexpr (Adapters::is_set_v<U>)
        return TypeCategory::Set;
      else if constexpr (Adapters::is_map_v<U>)
        return TypeCategory::Map;
      else
        return TypeCategory::Object;
    }
  } // namespace detail

  template <class T>
  const TypeToken &TokenOf();

  namespace detail
  {
    template <class U>
    TypeToken MakeToken()
    {
      TypeToken t{};
      if constexpr (std::is_void_v<U>)
      {
        t.name = "void";
        t.id = 0;
      }
      else
      {
        t.name = NGIN::Meta::TypeName<U>::qualifiedName;
        t.id = TypeIdOf<U>();
      }
      t.category = CategoryOf<U>();
      if constexpr (Adapters::is_sequence_v<U>)
        t.element = &TokenOf<typename Adapters::is_sequence<U>::element_type>();
      else if constexpr (Adapters::is_set_v<U>)
        t.element = &TokenOf<typename Adapters::is_set<U>::element_type>();
      else if constexpr (Adapters::is_map_v<U>)
      {
        t.key = &TokenOf<typename Adapters::is_map<U>::key_type>();
        t.value = &TokenOf<typename Adapters::is_map<U>::mapped_type>();
      }
      else if constexpr (Adapters::is_optional_v<U>)
        t.value = &TokenOf<typename Adapters::is_optional<U>::value_type>();
      else if constexpr (IsReadOnlyObservableV<U>)
        t.value = &TokenOf<typename ObservableTraits<U>::Value>();
      return t;
    }
  } // namespace detail

  template <class T>
  const TypeToken &TokenOf()
  {
    using U = std::remove_cvref_t<T>;
    if constexpr (!std::is_same_v<U, T>)
    {
      return TokenOf<U>();
    }
    else
    {
      static const TypeToken token = detail::MakeToken<U>();
      return token;
    }
  }

  [[nodiscard]] inline bool IsOptional(const TypeToken &t) noexcept
  {
    return t.category == TypeCategory::Optional;
  }

  // True for both read-only and writable boxes.
  [[nodiscard]] inline bool IsReadOnlyObservable(const TypeToken &t) noexcept
  {
    return t.category == TypeCategory::ReadOnlyObservable || t.category == TypeCategory::Observable;
  }

  [[nodiscard]] inline bool IsObservable(const TypeToken &t) noexcept
  {
    return t.category == TypeCategory::Observable;
  }

  // Strip one level of Optional or observable box.
  [[nodiscard]] inline const TypeToken &UnwrapValueType(const TypeToken &t) noexcept
  {
    if ((IsOptional(t) || IsReadOnlyObservable(t)) && t.value != nullptr)
      return *t.value;
    return t;
  }

} // namespace Propel::Properties
