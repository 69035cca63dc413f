#pragma once

#include <cstdint>
#include <optional>

#include <Eigen/Dense>

#include "gauss_newton.hpp"
#include "packets.hpp"

#include "anchor_table.hpp"

namespace localization {

    struct PositionEstimate {
        uint16_t tag_addr = 0;
        Eigen::Vector3d point = Eigen::Vector3d::Zero();   // Origin when not valid
        bool valid = false;
    };

    /**
     * @brief Turns one range vector into a 3D point using the anchor table
     *
     * Ranges that are non-finite or above maxRange mean "no measurement from this anchor"
     * and are dropped together with their anchor. Slots beyond the anchor table are ignored.
     */
    class Localizer {
    public:
        Localizer(const AnchorTable& anchors, double maxRange,
                  const Trilat::GaussNewtonConfig& config = Trilat::GaussNewtonConfig());

        std::optional<Eigen::Vector3d> Localize(const proto::Ranges& ranges) const;

        PositionEstimate Estimate(const proto::RangeReport& report) const;

        size_t ValidPairs(const proto::Ranges& ranges) const;

    private:
        bool IsValidRange(double range) const;

        AnchorTable m_Anchors;
        double m_MaxRange;
        Trilat::GaussNewtonConfig m_Config;
    };

}
