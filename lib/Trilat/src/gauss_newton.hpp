#pragma once

#include <Eigen/Dense>
#include <Eigen/SVD>

#include <optional>

#include <etl/span.h>

/**
 * @brief Gauss-Newton range trilateration
 *
 * Minimizes sum((|anchor_i - p| - range_i)^2) starting from the origin. Each iteration
 * linearizes the residuals and applies the pseudo-inverse of the Jacobian.
 *
 * @note  Local solver. Degenerate geometry (collinear/coplanar anchors, less than 3
 *        independent constraints) is absorbed by the pseudo-inverse and gives a numerically
 *        defined but possibly poor estimate.
 */
namespace Trilat {

    struct AnchorRange {
        Eigen::Vector3d anchor;
        double range;
    };

    struct GaussNewtonConfig {
        int maxIterations = 45;
        double convergenceThreshold = 1e-3;     // On the sum of squared residuals
        double minDistance = 1e-6;              // Jacobian denominator floor
        double singularValueCutoff = 1e-9;
    };

    struct GaussNewtonResult {
        Eigen::Vector3d position;
        double residualSquaredNorm;
        int iterations;
        bool converged;
    };

    /**
     * @brief Solve for the point that best matches the given ranges
     *
     * @param pairs Anchor position and measured range, one per valid measurement
     * @return std::nullopt only if pairs is empty. Non-convergence still returns the last guess.
     */
    std::optional<GaussNewtonResult> GaussNewton(etl::span<const AnchorRange> pairs,
                                                 const GaussNewtonConfig& config = GaussNewtonConfig());

    /**
     * @brief Moore-Penrose pseudo-inverse through SVD
     *
     * Singular values at or below the cutoff are treated as zero.
     */
    Eigen::MatrixXd PseudoInverse(const Eigen::MatrixXd& matrix, double cutoff);

}
