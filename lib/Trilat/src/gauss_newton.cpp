#include "gauss_newton.hpp"

namespace Trilat {

    // Residual = computed distance - measured distance
    static Eigen::VectorXd CalculateResiduals(etl::span<const AnchorRange> pairs,
                                              const Eigen::Vector3d& guess,
                                              const GaussNewtonConfig& config,
                                              Eigen::MatrixX3d& jacobian)
    {
        const Eigen::Index rows = static_cast<Eigen::Index>(pairs.size());
        Eigen::VectorXd residuals(rows);
        jacobian.resize(rows, 3);

        for (Eigen::Index i = 0; i < rows; ++i) {
            const Eigen::Vector3d diff = pairs[i].anchor - guess;
            const double distance = diff.norm();

            // Avoid division by zero when the guess sits on an anchor
            const double denominator = distance < config.minDistance ? config.minDistance : distance;
            jacobian.row(i) = (diff / denominator).transpose();
            residuals(i) = distance - pairs[i].range;
        }

        return residuals;
    }

    Eigen::MatrixXd PseudoInverse(const Eigen::MatrixXd& matrix, double cutoff)
    {
        Eigen::JacobiSVD<Eigen::MatrixXd> svd(matrix, Eigen::ComputeThinU | Eigen::ComputeThinV);
        const Eigen::VectorXd& singular = svd.singularValues();

        Eigen::VectorXd inverted = Eigen::VectorXd::Zero(singular.size());
        for (Eigen::Index i = 0; i < singular.size(); ++i) {
            if (singular(i) > cutoff) {
                inverted(i) = 1.0 / singular(i);
            }
        }

        return svd.matrixV() * inverted.asDiagonal() * svd.matrixU().transpose();
    }

    std::optional<GaussNewtonResult> GaussNewton(etl::span<const AnchorRange> pairs,
                                                 const GaussNewtonConfig& config)
    {
        if (pairs.empty()) {
            return std::nullopt;
        }

        GaussNewtonResult result;
        result.position = Eigen::Vector3d::Zero();
        result.residualSquaredNorm = 0.0;
        result.iterations = 0;
        result.converged = false;

        Eigen::MatrixX3d jacobian;

        for (int i = 0; i < config.maxIterations; ++i) {
            result.iterations++;

            Eigen::VectorXd residuals = CalculateResiduals(pairs, result.position, config, jacobian);

            // The Jacobian rows point from the guess to the anchor, hence the plus sign
            result.position += PseudoInverse(jacobian, config.singularValueCutoff) * residuals;
            result.residualSquaredNorm = residuals.squaredNorm();

            if (result.residualSquaredNorm < config.convergenceThreshold) {
                result.converged = true;
                break;
            }
        }

        return result;
    }

}
