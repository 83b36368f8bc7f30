#include <Propel/Properties/Logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace Propel::Properties
{

  namespace detail
  {
    spdlog::logger &Log()
    {
      static std::shared_ptr<spdlog::logger> logger = []
      {
        auto existing = spdlog::get("propel.properties");
        if (existing)
          return existing;
        auto created = spdlog::stderr_color_mt("propel.properties");
        created->set_level(spdlog::level::warn);
        created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
      }();
      return *logger;
    }
  } // namespace detail

  void SetLogLevel(spdlog::level::level_enum level)
  {
    detail::Log().set_level(level);
  }

} // namespace Propel::Properties
