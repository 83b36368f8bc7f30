#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(PROPEL_PROPERTIES_STATIC)
    #define PROPEL_PROPERTIES_API
  #else
    #if defined(PROPEL_PROPERTIES_EXPORTS)
      #define PROPEL_PROPERTIES_API __declspec(dllexport)
    #else
      #define PROPEL_PROPERTIES_API __declspec(dllimport)
    #endif
  #endif
#else
  #define PROPEL_PROPERTIES_API
#endif
