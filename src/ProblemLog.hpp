// ProblemLog.hpp
// Accumulates per-property build problems across a whole hierarchy walk
#pragma once

#include <map>
#include <string>
#include <string_view>

#include <Propel/Properties/Types.hpp>

namespace Propel::Properties::detail
{

  class ProblemLog
  {
  public:
    void Report(std::string_view property, ErrorCode code, std::string message);

    [[nodiscard]] bool Empty() const noexcept { return m_problems.empty(); }
    [[nodiscard]] std::size_t Size() const noexcept;

    // One BuildFailed error listing every problem, sorted by property then message.
    [[nodiscard]] Error ToError(std::string_view rootClass) const;

  private:
    // property -> (message -> code)
    std::map<std::string, std::map<std::string, ErrorCode>, std::less<>> m_problems;
  };

} // namespace Propel::Properties::detail
