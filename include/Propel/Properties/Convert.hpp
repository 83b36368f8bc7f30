// Convert.hpp - Any -> T conversion used by boxed writes and typed reads
#pragma once

#include <NGIN/Primitives.hpp>

#include <cmath>
#include <expected>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include <Propel/Properties/Adapters.hpp>
#include <Propel/Properties/Types.hpp>
#include <Propel/Properties/TypeToken.hpp>

namespace Propel::Properties::detail
{

  template <class... Ts>
  struct TypeList
  {
  };

  // Every arithmetic type an Any may carry into a numeric slot.
  using ArithmeticSources = TypeList<bool, signed char, unsigned char, char, short, unsigned short, int, unsigned int, long,
                                     unsigned long, long long, unsigned long long, float, double, long double>;

  // True when static_cast<Dest>(v) is defined and keeps the value (floating sources truncate toward zero).
  template <class Dest, class Src>
  constexpr bool FitsIn(Src v) noexcept
  {
    if constexpr (std::is_same_v<Dest, bool> || std::is_same_v<Src, bool>)
    {
      return true;
    }
    else if constexpr (std::is_integral_v<Dest> && std::is_integral_v<Src>)
    {
      // Unary plus promotes character types, which std::cmp_* does not accept.
      return std::cmp_greater_equal(+v, +std::numeric_limits<Dest>::min()) &&
             std::cmp_less_equal(+v, +std::numeric_limits<Dest>::max());
    }
    else if constexpr (std::is_integral_v<Dest>)
    {
      const long double t = std::trunc(static_cast<long double>(v));
      // Both bounds are powers of two and therefore exact in any floating type.
      const long double lower = static_cast<long double>(std::numeric_limits<Dest>::min());
      const long double upper = static_cast<long double>(std::numeric_limits<Dest>::max() / 2 + 1) * 2;
      return std::isfinite(t) && t >= lower && t < upper;
    }
    else if constexpr (std::is_floating_point_v<Src> && sizeof(Src) > sizeof(Dest))
    {
      if (!std::isfinite(v))
        return true;
      return v >= std::numeric_limits<Dest>::lowest() && v <= std::numeric_limits<Dest>::max();
    }
    else
    {
      return true;
    }
  }

  template <class Dest, class Src>
  std::expected<Dest, Error> NarrowTo(Src v)
  {
    if (!FitsIn<Dest>(v))
      return std::unexpected(Error{ErrorCode::TypeMismatch, "value is out of range for " + std::string{TokenOf<Dest>().name}});
    return static_cast<Dest>(v);
  }

  template <class Dest, class... Src>
  std::optional<std::expected<Dest, Error>> CastArithmetic(const Any &src, TypeId tid, TypeList<Src...>)
  {
    std::optional<std::expected<Dest, Error>> out;
    (void)((tid == TypeIdOf<Src>() ? (out.emplace(NarrowTo<Dest>(src.template Cast<Src>())), true) : false) || ...);
    return out;
  }

  // Exact type match, or a range-checked cast between arithmetic types.
  // An optional destination also accepts its payload type.
  template <class To>
  std::expected<std::remove_cvref_t<To>, Error> ConvertAny(const Any &src)
  {
    using Dest = std::remove_cvref_t<To>;
    const auto tid = src.GetTypeId();
    if (tid == TypeIdOf<Dest>())
      return src.template Cast<Dest>();
    if constexpr (Adapters::is_optional_v<Dest>)
    {
      auto inner = ConvertAny<typename Adapters::is_optional<Dest>::value_type>(src);
      if (!inner)
        return std::unexpected(inner.error());
      return Dest{std::move(*inner)};
    }
    else if constexpr (std::is_arithmetic_v<Dest>)
    {
      if (auto converted = CastArithmetic<Dest>(src, tid, ArithmeticSources{}))
        return std::move(*converted);
    }
    return std::unexpected(Error{ErrorCode::TypeMismatch, "value is not convertible to " + std::string{TokenOf<Dest>().name}});
  }

} // namespace Propel::Properties::detail
