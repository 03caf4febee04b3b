#pragma once

#include "acceptor/logging/logger_registry.h"

// Component must be defined before using ACCEPTOR_LOG
#ifndef ACCEPTOR_LOG_COMPONENT
#define ACCEPTOR_LOG_COMPONENT "default"
#endif

#ifdef ACCEPTOR_LOG_DISABLE
#define ACCEPTOR_LOG(level, ...) ((void)0)
#else
#define ACCEPTOR_LOG(level, ...)                                           \
  do {                                                                     \
    auto acceptor_logger_ =                                                \
        ::acceptor::logging::LoggerRegistry::instance().getOrCreateLogger( \
            ACCEPTOR_LOG_COMPONENT);                                       \
    if (acceptor_logger_->shouldLog(::acceptor::logging::LogLevel::level)) { \
      acceptor_logger_->log(::acceptor::logging::LogLevel::level, __FILE__, \
                            __LINE__, __FUNCTION__, __VA_ARGS__);          \
    }                                                                      \
  } while (0)
#endif

#define ACCEPTOR_LOG_DEBUG(...) ACCEPTOR_LOG(Debug, __VA_ARGS__)
#define ACCEPTOR_LOG_INFO(...) ACCEPTOR_LOG(Info, __VA_ARGS__)
#define ACCEPTOR_LOG_WARNING(...) ACCEPTOR_LOG(Warning, __VA_ARGS__)
#define ACCEPTOR_LOG_ERROR(...) ACCEPTOR_LOG(Error, __VA_ARGS__)

// Structured variant: ctx is a LogContext carrying ids and key-values
#define ACCEPTOR_LOG_WITH_CONTEXT(level, context, ...)                     \
  do {                                                                     \
    auto acceptor_logger_ =                                                \
        ::acceptor::logging::LoggerRegistry::instance().getOrCreateLogger( \
            ACCEPTOR_LOG_COMPONENT);                                       \
    if (acceptor_logger_->shouldLog(::acceptor::logging::LogLevel::level)) { \
      acceptor_logger_->logWithContext(                                    \
          ::acceptor::logging::LogLevel::level, context, __VA_ARGS__);     \
    }                                                                      \
  } while (0)
