/**
 * @file features.hpp
 * @brief Compile-time feature flags of the gateway
 *
 * Flags are set from the build (add_compile_definitions). A build that sets none
 * of them gets the full default set below.
 *
 *   USE_LOGGING              LOG_* macros, compiled out otherwise
 *   USE_LOGGING_STDERR       "[ms][L][file] message" lines on stderr
 *   USE_LOGGING_UDP          JSON log datagrams (gateway.logUdpHost)
 *   USE_PUBLISH_UDP          Topic datagrams to gateway.publishHost
 *   USE_PUBLISH_STREAM       Topic lines on stdout (-o)
 *   USE_SERIAL_LOW_LATENCY   ASYNC_LOW_LATENCY on the anchor serial ports
 *
 * Include this before testing any of the flags.
 */

#pragma once

#if !defined(USE_LOGGING) && \
    !defined(USE_PUBLISH_UDP) && \
    !defined(USE_PUBLISH_STREAM) && \
    !defined(USE_SERIAL_LOW_LATENCY)
    #define MAGICLOC_USE_DEFAULT_FEATURES
#endif

#ifdef MAGICLOC_USE_DEFAULT_FEATURES
    #define USE_LOGGING
    #define USE_LOGGING_STDERR
    #define USE_LOGGING_UDP
    #define USE_PUBLISH_UDP
    #define USE_PUBLISH_STREAM
    #define USE_SERIAL_LOW_LATENCY
#endif

// Logging without an explicit output writes to stderr
#if defined(USE_LOGGING) && !defined(USE_LOGGING_STDERR) && !defined(USE_LOGGING_UDP)
    #define USE_LOGGING_STDERR
#endif

#if defined(USE_PUBLISH_UDP) || defined(USE_PUBLISH_STREAM)
    #define HAS_PUBLISH_OUTPUT 1
#endif

#include "feature_validation.hpp"
