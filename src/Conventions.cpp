#include <Propel/Properties/Conventions.hpp>

#include <algorithm>
#include <cctype>

namespace Propel::Properties
{

  std::optional<std::string_view> MatchesPrefix(std::string_view value, std::span<const std::string> prefixes) noexcept
  {
    for (const auto &prefix : prefixes)
    {
      if (value.size() > prefix.size() && value.starts_with(prefix))
        return std::string_view{prefix};
    }
    return std::nullopt;
  }

  std::optional<std::string_view> MatchesSuffix(std::string_view value, std::span<const std::string> suffixes) noexcept
  {
    for (const auto &suffix : suffixes)
    {
      if (value.size() > suffix.size() && value.ends_with(suffix))
        return std::string_view{suffix};
    }
    return std::nullopt;
  }

  std::expected<std::string, Error> RemovePrefix(std::string_view value, std::string_view prefix)
  {
    if (value.empty())
      return std::unexpected(Error{ErrorCode::ConventionViolation, "cannot derive a property name from an empty member name"});
    if (prefix.empty() || !value.starts_with(prefix))
      return std::string{value};
    if (value.size() == prefix.size())
    {
      return std::unexpected(Error{ErrorCode::ConventionViolation,
                                   "member name '" + std::string{value} + "' is only the prefix '" + std::string{prefix} + "'"});
    }
    std::string out{value.substr(prefix.size())};
    out[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[0])));
    return out;
  }

  std::expected<std::string, Error> RemoveSuffix(std::string_view value, std::string_view suffix)
  {
    if (value.empty())
      return std::unexpected(Error{ErrorCode::ConventionViolation, "cannot derive a property name from an empty member name"});
    if (suffix.empty() || !value.ends_with(suffix))
      return std::string{value};
    if (value.size() == suffix.size())
    {
      return std::unexpected(Error{ErrorCode::ConventionViolation,
                                   "member name '" + std::string{value} + "' is only the suffix '" + std::string{suffix} + "'"});
    }
    return std::string{value.substr(0, value.size() - suffix.size())};
  }

  void AppendUnique(std::vector<std::string> &set, std::string_view value)
  {
    if (std::find(set.begin(), set.end(), value) == set.end())
      set.emplace_back(value);
  }

} // namespace Propel::Properties
