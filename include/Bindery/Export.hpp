#pragma once

#if defined(_WIN32) || defined(_WIN64)
  #if defined(BINDERY_STATIC)
    #define BINDERY_API
  #else
    #if defined(BINDERY_EXPORTS)
      #define BINDERY_API __declspec(dllexport)
    #else
      #define BINDERY_API __declspec(dllimport)
    #endif
  #endif
#else
  #define BINDERY_API
#endif
