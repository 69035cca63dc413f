#include "gateway_frontend.hpp"

localization::AnchorTable MakeAnchorTable(const GatewayParams& params)
{
    const double coords[localization::kMaxAnchors][3] = {
        {params.x1, params.y1, params.z1},
        {params.x2, params.y2, params.z2},
        {params.x3, params.y3, params.z3},
        {params.x4, params.y4, params.z4},
        {params.x5, params.y5, params.z5},
        {params.x6, params.y6, params.z6},
        {params.x7, params.y7, params.z7},
        {params.x8, params.y8, params.z8},
    };

    const size_t count = params.anchorCount < localization::kMaxAnchors ? params.anchorCount : localization::kMaxAnchors;

    localization::AnchorTable table;
    for (size_t i = 0; i < count; i++) {
        table.push_back({coords[i][0], coords[i][1], coords[i][2]});
    }
    return table;
}

namespace Front {
    GatewayFrontend gatewayFront;
}
