#pragma once

#include <cstddef>
#include <iterator>

#include <etl/vector.h>

namespace localization {

    static constexpr size_t kMaxAnchors = 8;

    struct AnchorCoordinate {
        double x;
        double y;
        double z;
    };

    // Slot index = position in the table = index into a range report's ranges
    using AnchorTable = etl::vector<AnchorCoordinate, kMaxAnchors>;

    // Surveyed anchor positions of the reference deployment [m]
    static constexpr AnchorCoordinate kDefaultAnchors[kMaxAnchors] = {
        {6.1, 9.2, 3.0},
        {5.0, 0.0, 2.7},
        {8.9, 9.1, 3.0},
        {3.8, 0.0, 2.5},
        {0.8, 0.0, 2.8},
        {2.0, 9.0, 3.0},
        {5.7, 9.2, 1.5},
        {6.1, 9.2, 0.0},
    };

    inline AnchorTable DefaultAnchorTable() {
        return AnchorTable(std::begin(kDefaultAnchors), std::end(kDefaultAnchors));
    }

}
