#include "localizer.hpp"

#include <cmath>

#include <etl/vector.h>

#include "logging/logging.hpp"

namespace localization {

    Localizer::Localizer(const AnchorTable& anchors, double maxRange, const Trilat::GaussNewtonConfig& config)
        : m_Anchors(anchors), m_MaxRange(maxRange), m_Config(config)
    {
    }

    bool Localizer::IsValidRange(double range) const
    {
        return std::isfinite(range) && range <= m_MaxRange;
    }

    size_t Localizer::ValidPairs(const proto::Ranges& ranges) const
    {
        size_t count = 0;
        for (size_t i = 0; i < ranges.size() && i < m_Anchors.size(); i++) {
            if (IsValidRange(ranges[i])) {
                count++;
            }
        }
        return count;
    }

    std::optional<Eigen::Vector3d> Localizer::Localize(const proto::Ranges& ranges) const
    {
        etl::vector<Trilat::AnchorRange, kMaxAnchors> pairs;

        for (size_t i = 0; i < ranges.size() && i < m_Anchors.size(); i++) {
            if (!IsValidRange(ranges[i])) {
                continue;
            }
            const AnchorCoordinate& anchor = m_Anchors[i];
            pairs.push_back({Eigen::Vector3d(anchor.x, anchor.y, anchor.z), ranges[i]});
        }

        auto result = Trilat::GaussNewton(etl::span<const Trilat::AnchorRange>(pairs.data(), pairs.size()), m_Config);
        if (!result) {
            return std::nullopt;
        }

        if (!result->converged) {
            LOG_DEBUG("No convergence after %d iterations, residual %.4f", result->iterations, result->residualSquaredNorm);
        }
        LOG_VERBOSE("Solved with %u anchors in %d iterations: %.3f, %.3f, %.3f",
                    static_cast<unsigned>(pairs.size()), result->iterations,
                    result->position.x(), result->position.y(), result->position.z());

        return result->position;
    }

    PositionEstimate Localizer::Estimate(const proto::RangeReport& report) const
    {
        PositionEstimate estimate;
        estimate.tag_addr = report.tag_addr;

        auto point = Localize(report.ranges);
        if (point) {
            estimate.point = *point;
            estimate.valid = true;
        }
        return estimate;
    }

}
