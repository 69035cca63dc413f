#pragma once

#include "gateway_params.hpp"
#include "file_frontend.hpp"

class GatewayFrontend : public FileFrontend<GatewayParams> {
public:
    GatewayFrontend() : FileFrontend<GatewayParams>("gateway") {}

    virtual etl::span<const ParamDef> GetParamLayout() const override {
        return etl::span<const ParamDef>(s_ParamDefs, sizeof(s_ParamDefs)/sizeof(ParamDef));
    }

public:
    static constexpr ParamDef s_ParamDefs[] = {
        PARAM_DEF(GatewayParams, anchorCount),
        PARAM_DEF(GatewayParams, x1),
        PARAM_DEF(GatewayParams, y1),
        PARAM_DEF(GatewayParams, z1),
        PARAM_DEF(GatewayParams, x2),
        PARAM_DEF(GatewayParams, y2),
        PARAM_DEF(GatewayParams, z2),
        PARAM_DEF(GatewayParams, x3),
        PARAM_DEF(GatewayParams, y3),
        PARAM_DEF(GatewayParams, z3),
        PARAM_DEF(GatewayParams, x4),
        PARAM_DEF(GatewayParams, y4),
        PARAM_DEF(GatewayParams, z4),
        PARAM_DEF(GatewayParams, x5),
        PARAM_DEF(GatewayParams, y5),
        PARAM_DEF(GatewayParams, z5),
        PARAM_DEF(GatewayParams, x6),
        PARAM_DEF(GatewayParams, y6),
        PARAM_DEF(GatewayParams, z6),
        PARAM_DEF(GatewayParams, x7),
        PARAM_DEF(GatewayParams, y7),
        PARAM_DEF(GatewayParams, z7),
        PARAM_DEF(GatewayParams, x8),
        PARAM_DEF(GatewayParams, y8),
        PARAM_DEF(GatewayParams, z8),
        PARAM_DEF(GatewayParams, rangeBias),
        PARAM_DEF(GatewayParams, imuGapThresholdUs),
        PARAM_DEF(GatewayParams, maxRange),
        PARAM_DEF(GatewayParams, syncMaxQueueDepth),
        PARAM_DEF(GatewayParams, baudRate),
        PARAM_DEF(GatewayParams, lowLatency),
        PARAM_DEF(GatewayParams, publishHost),
        PARAM_DEF(GatewayParams, publishPort),
        PARAM_DEF(GatewayParams, logUdpHost),
        PARAM_DEF(GatewayParams, logUdpPort)
    };
};

namespace Front {
    extern GatewayFrontend gatewayFront;
}
