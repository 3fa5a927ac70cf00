#pragma once

#include "duplex/logging/logger_registry.h"

// Usage: define DUPLEX_LOG_COMPONENT before including this header, then
//   DUPLEX_LOG(Debug, "poll request from {}", peer);
#ifdef DUPLEX_LOG_DISABLE
#define DUPLEX_LOG(level, ...) ((void)0)
#else
#define DUPLEX_LOG(level, ...)                                           \
  do {                                                                   \
    if (::duplex::logging::LoggerRegistry::instance().shouldLog(         \
            DUPLEX_LOG_COMPONENT, ::duplex::logging::LogLevel::level)) { \
      ::duplex::logging::LoggerRegistry::instance()                      \
          .getOrCreateLogger(DUPLEX_LOG_COMPONENT)                       \
          ->log(::duplex::logging::LogLevel::level, __FILE__, __LINE__,  \
                __FUNCTION__, __VA_ARGS__);                              \
    }                                                                    \
  } while (0)
#endif

// Component must be defined before using DUPLEX_LOG
#ifndef DUPLEX_LOG_COMPONENT
#define DUPLEX_LOG_COMPONENT "root"
#endif
