// NameUtils.hpp
// Field names derived from pointer-to-member constants
#pragma once

#include <string_view>

namespace Propel::Properties::detail
{

  // Text between `open` and the next `close` in a compiler signature; empty when absent.
  constexpr std::string_view SignatureSlice(std::string_view sig, std::string_view open, char close) noexcept
  {
    const auto at = sig.find(open);
    if (at == std::string_view::npos)
      return {};
    const auto start = at + open.size();
    const auto end = sig.find(close, start);
    if (end == std::string_view::npos)
      return {};
    auto slice = sig.substr(start, end - start);
    while (!slice.empty() && slice.back() == ' ')
      slice.remove_suffix(1);
    return slice;
  }

  // &Ns::Class::member -> "member"
  template <auto MemberPtr>
  consteval std::string_view MemberName() noexcept
  {
#if defined(_MSC_VER)
    constexpr auto qualified = SignatureSlice(__FUNCSIG__, "< &", '>');
#elif defined(__clang__) || defined(__GNUC__)
    // clang: "[MemberPtr = &C::m]", gcc: "[with auto MemberPtr = &C::m]"
    constexpr auto qualified = SignatureSlice(__PRETTY_FUNCTION__, "MemberPtr = &", ']');
#else
    constexpr std::string_view qualified{};
#endif
    const auto scope = qualified.rfind("::");
    return scope == std::string_view::npos ? qualified : qualified.substr(scope + 2);
  }

} // namespace Propel::Properties::detail
