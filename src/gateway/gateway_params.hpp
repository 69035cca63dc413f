#pragma once

#include <cstdint>

#include <etl/array.h>

#include "utils/utils.hpp"
#include "localization/anchor_table.hpp"

using HostName = etl::array<char, 64>;

struct GatewayParams {
    uint8_t anchorCount = localization::kMaxAnchors;   // Anchors used by the solver, slots 1..anchorCount
    // Anchor locations, slot i matches ranges[i-1] of a range report
    double x1 = localization::kDefaultAnchors[0].x;
    double y1 = localization::kDefaultAnchors[0].y;
    double z1 = localization::kDefaultAnchors[0].z;
    double x2 = localization::kDefaultAnchors[1].x;
    double y2 = localization::kDefaultAnchors[1].y;
    double z2 = localization::kDefaultAnchors[1].z;
    double x3 = localization::kDefaultAnchors[2].x;
    double y3 = localization::kDefaultAnchors[2].y;
    double z3 = localization::kDefaultAnchors[2].z;
    double x4 = localization::kDefaultAnchors[3].x;
    double y4 = localization::kDefaultAnchors[3].y;
    double z4 = localization::kDefaultAnchors[3].z;
    double x5 = localization::kDefaultAnchors[4].x;
    double y5 = localization::kDefaultAnchors[4].y;
    double z5 = localization::kDefaultAnchors[4].z;
    double x6 = localization::kDefaultAnchors[5].x;
    double y6 = localization::kDefaultAnchors[5].y;
    double z6 = localization::kDefaultAnchors[5].z;
    double x7 = localization::kDefaultAnchors[6].x;
    double y7 = localization::kDefaultAnchors[6].y;
    double z7 = localization::kDefaultAnchors[6].z;
    double x8 = localization::kDefaultAnchors[7].x;
    double y8 = localization::kDefaultAnchors[7].y;
    double z8 = localization::kDefaultAnchors[7].z;
    double rangeBias = 76.8;                // Calibration bias subtracted from every range [m]
    uint32_t imuGapThresholdUs = 1500;      // IMU inter-arrival gap reported as anomaly
    double maxRange = 1e6;                  // Ranges above this are "no measurement"
    // Per anchor FIFO bound, 0 = unbounded. A bound caps memory while an anchor is
    // silent, but an anchor lagging by more than that many rounds loses its matches.
    uint32_t syncMaxQueueDepth = 0;
    uint32_t baudRate = 921600;
    bool lowLatency = true;                 // Linux ASYNC_LOW_LATENCY on the serial ports
    HostName publishHost = {{"127.0.0.1"}};
    uint16_t publishPort = 5555;
    HostName logUdpHost = {};               // Empty = UDP logging disabled
    uint16_t logUdpPort = 3334;
}ULS_PACKED;

/**
 * @brief Anchor coordinates of slots 1..anchorCount
 */
localization::AnchorTable MakeAnchorTable(const GatewayParams& params);
