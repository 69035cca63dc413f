/**
 * @file feature_validation.hpp
 * @brief Rejects inconsistent feature flag combinations, included by features.hpp
 */

#pragma once

#if (defined(USE_LOGGING_UDP) || defined(USE_LOGGING_STDERR)) && !defined(USE_LOGGING)
    #error "USE_LOGGING_UDP and USE_LOGGING_STDERR require USE_LOGGING"
#endif

// The gateway has nowhere to put ranges, points, imu and cir otherwise
#if !defined(HAS_PUBLISH_OUTPUT)
    #error "At least one publish sink must be enabled: USE_PUBLISH_UDP or USE_PUBLISH_STREAM"
#endif
