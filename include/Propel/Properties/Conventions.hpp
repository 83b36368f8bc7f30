// Conventions.hpp
// Name-based matching that maps member names onto property names
#pragma once

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <Propel/Properties/Export.hpp>
#include <Propel/Properties/Types.hpp>

namespace Propel::Properties
{

  // Ordered affix sets; the first matching affix wins.
  struct NamingConventions
  {
    std::vector<std::string> fieldPrefixes{""};
    std::vector<std::string> propertySuffixes{"Property"};
    std::vector<std::string> getterPrefixes{"get", "is"};
    std::vector<std::string> setterPrefixes{"set"};
    // Classes whose qualified name starts with one of these are never walked.
    std::vector<std::string> excludedNamespaces{"std::", "NGIN::", "Propel::"};
  };

  // First prefix that `value` starts with and is strictly longer than.
  [[nodiscard]] PROPEL_PROPERTIES_API std::optional<std::string_view> MatchesPrefix(std::string_view value,
                                                                                   std::span<const std::string> prefixes) noexcept;

  // First suffix that `value` ends with and is strictly longer than.
  [[nodiscard]] PROPEL_PROPERTIES_API std::optional<std::string_view> MatchesSuffix(std::string_view value,
                                                                                   std::span<const std::string> suffixes) noexcept;

  // Drop `prefix` and lower-case the first remaining character: ("getFoo", "get") -> "foo".
  // An empty prefix, or one `value` does not start with, leaves `value` unchanged.
  [[nodiscard]] PROPEL_PROPERTIES_API std::expected<std::string, Error> RemovePrefix(std::string_view value, std::string_view prefix);

  // Drop `suffix`; case is preserved: ("fooProperty", "Property") -> "foo".
  [[nodiscard]] PROPEL_PROPERTIES_API std::expected<std::string, Error> RemoveSuffix(std::string_view value, std::string_view suffix);

  // Insert `value` unless already present, keeping first-seen order.
  PROPEL_PROPERTIES_API void AppendUnique(std::vector<std::string> &set, std::string_view value);

} // namespace Propel::Properties
