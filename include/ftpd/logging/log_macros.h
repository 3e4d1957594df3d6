#pragma once

#include "ftpd/logging/logger_registry.h"

// Component must be defined before using FTPD_LOG, e.g.
//   #define FTPD_LOG_COMPONENT "Reactor.loop"
#ifndef FTPD_LOG_COMPONENT
#define FTPD_LOG_COMPONENT "default"
#endif

#ifdef FTPD_LOG_DISABLE
#define FTPD_LOG(level, ...) ((void)0)
#define FTPD_CONN_LOG(level, connection_id, ...) ((void)0)
#else
#define FTPD_LOG(level, ...)                                           \
  do {                                                                 \
    if (::ftpd::logging::LoggerRegistry::instance().shouldLog(         \
            FTPD_LOG_COMPONENT, ::ftpd::logging::LogLevel::level)) {   \
      ::ftpd::logging::LoggerRegistry::instance()                      \
          .getOrCreateLogger(FTPD_LOG_COMPONENT)                       \
          ->log(::ftpd::logging::LogLevel::level, __FILE__, __LINE__,  \
                __FUNCTION__, __VA_ARGS__);                            \
    }                                                                  \
  } while (0)

// Same, with the record tagged by a connection id
#define FTPD_CONN_LOG(level, connection_id, ...)                       \
  do {                                                                 \
    if (::ftpd::logging::LoggerRegistry::instance().shouldLog(         \
            FTPD_LOG_COMPONENT, ::ftpd::logging::LogLevel::level)) {   \
      ::ftpd::logging::LoggerRegistry::instance()                      \
          .getOrCreateLogger(FTPD_LOG_COMPONENT)                       \
          ->logConnection(::ftpd::logging::LogLevel::level,            \
                          (connection_id), __FILE__, __LINE__,         \
                          __FUNCTION__, __VA_ARGS__);                  \
    }                                                                  \
  } while (0)
#endif

#define FTPD_LOG_DEBUG(...) FTPD_LOG(Debug, __VA_ARGS__)
#define FTPD_LOG_INFO(...) FTPD_LOG(Info, __VA_ARGS__)
#define FTPD_LOG_WARNING(...) FTPD_LOG(Warning, __VA_ARGS__)
#define FTPD_LOG_ERROR(...) FTPD_LOG(Error, __VA_ARGS__)

#define FTPD_CONN_LOG_DEBUG(id, ...) FTPD_CONN_LOG(Debug, id, __VA_ARGS__)
#define FTPD_CONN_LOG_INFO(id, ...) FTPD_CONN_LOG(Info, id, __VA_ARGS__)
#define FTPD_CONN_LOG_WARNING(id, ...) FTPD_CONN_LOG(Warning, id, __VA_ARGS__)
#define FTPD_CONN_LOG_ERROR(id, ...) FTPD_CONN_LOG(Error, id, __VA_ARGS__)
