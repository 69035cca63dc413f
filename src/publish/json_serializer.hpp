#pragma once

#include <string>

#include <etl/span.h>

#include "packets.hpp"
#include "localization/localizer.hpp"
#include "sync/range_synchronizer.hpp"

/**
 * @brief JSON payloads of the published topics
 *
 * Field order follows the wire records. Non-finite numbers are written as null.
 */
namespace publish {

    std::string ToJson(const proto::RangeReport& report);
    std::string ToJson(const stream_sync::Batch& batch);
    std::string ToJson(etl::span<const localization::PositionEstimate> points);
    std::string ToJson(const proto::ImuReport& report);
    std::string ToJson(const proto::ConvertedCirReport& report);

}
