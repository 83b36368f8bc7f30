#include "ProblemLog.hpp"

#include <Propel/Properties/Logging.hpp>

#include <utility>

namespace Propel::Properties::detail
{

  void ProblemLog::Report(std::string_view property, ErrorCode code, std::string message)
  {
    Log().error("{}: {} ({})", property, message, ToString(code));
    auto it = m_problems.find(property);
    if (it == m_problems.end())
      it = m_problems.emplace(std::string{property}, std::map<std::string, ErrorCode>{}).first;
    it->second.emplace(std::move(message), code);
  }

  std::size_t ProblemLog::Size() const noexcept
  {
    std::size_t n = 0;
    for (const auto &[_, messages] : m_problems)
      n += messages.size();
    return n;
  }

  Error ProblemLog::ToError(std::string_view rootClass) const
  {
    std::string text{"Found property errors with class: "};
    text += rootClass;
    text += "\n";
    NGIN::Containers::Vector<PropertyProblem> problems;
    std::size_t index = 1;
    for (const auto &[property, messages] : m_problems)
    {
      for (const auto &[message, code] : messages)
      {
        text += "\t" + std::to_string(index++) + ")\t" + property + " ->" + message + "\n";
        problems.PushBack(PropertyProblem{property, code, message});
      }
    }
    return Error{ErrorCode::BuildFailed, std::move(text), std::move(problems)};
  }

} // namespace Propel::Properties::detail
