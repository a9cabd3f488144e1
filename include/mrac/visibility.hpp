#pragma once

#if defined(_WIN32) || defined(_WIN64)

  #if defined(MRAC_BUILD_DLL)
    #define MRAC_API __declspec(dllexport)

  #else
    #define MRAC_API __declspec(dllimport)

  #endif

#else
  #define MRAC_API __attribute__((visibility("default")))

#endif
