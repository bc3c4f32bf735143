#pragma once

/**
 * Symbol visibility macros for the pingwatch library.
 *
 * - When built as a shared object, PINGWATCH_BUILDING_SHARED exports the
 *   public entry points with default visibility.
 * - Internal helpers use PINGWATCH_LOCAL and stay hidden.
 *
 * The static build (the default) leaves both macros empty.
 */
#if __GNUC__ >= 4
  #ifdef PINGWATCH_BUILDING_SHARED
    #define PINGWATCH_API   __attribute__((visibility("default")))
  #else
    #define PINGWATCH_API
  #endif
  #define PINGWATCH_LOCAL __attribute__((visibility("hidden")))
#else
  #define PINGWATCH_API
  #define PINGWATCH_LOCAL
#endif
