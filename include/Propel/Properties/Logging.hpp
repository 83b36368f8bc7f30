// Logging.hpp
// Library logger ("propel.properties"), quiet by default
#pragma once

#include <spdlog/spdlog.h>

#include <Propel/Properties/Export.hpp>

namespace Propel::Properties
{

  // Adjust the library logger's threshold. Default: warn.
  PROPEL_PROPERTIES_API void SetLogLevel(spdlog::level::level_enum level);

  namespace detail
  {
    PROPEL_PROPERTIES_API spdlog::logger &Log();
  } // namespace detail

} // namespace Propel::Properties
