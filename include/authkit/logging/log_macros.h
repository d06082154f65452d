#pragma once

#include "authkit/logging/logger_registry.h"

// Each translation unit names its logger before including this header:
//   #define AUTHKIT_LOG_COMPONENT "authkit.oidc.token"
#ifndef AUTHKIT_LOG_COMPONENT
#define AUTHKIT_LOG_COMPONENT "authkit"
#endif

#ifdef AUTHKIT_LOG_DISABLE
#define AUTHKIT_LOG(level, ...) ((void)0)
#else
#define AUTHKIT_LOG(level, ...)                                           \
  do {                                                                    \
    if (::authkit::logging::LoggerRegistry::instance().shouldLog(         \
            AUTHKIT_LOG_COMPONENT, ::authkit::logging::LogLevel::level)) { \
      ::authkit::logging::LoggerRegistry::instance()                      \
          .getOrCreateLogger(AUTHKIT_LOG_COMPONENT)                       \
          ->log(::authkit::logging::LogLevel::level, __FILE__, __LINE__,  \
                __FUNCTION__, __VA_ARGS__);                               \
    }                                                                     \
  } while (0)
#endif

#define AUTHKIT_LOG_WITH_CONTEXT(level, context, ...)                       \
  do {                                                                      \
    auto authkit_logger_ =                                                  \
        ::authkit::logging::LoggerRegistry::instance().getOrCreateLogger(   \
            AUTHKIT_LOG_COMPONENT);                                         \
    if (authkit_logger_->shouldLog(::authkit::logging::LogLevel::level)) {  \
      authkit_logger_->logWithContext(::authkit::logging::LogLevel::level,  \
                                      context, __VA_ARGS__);                \
    }                                                                       \
  } while (0)
