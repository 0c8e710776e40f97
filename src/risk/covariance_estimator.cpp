/**
 * @file covariance_estimator.cpp
 * @brief Implementation of CovarianceEstimator
 */

#include "risk/covariance_estimator.hpp"
#include "risk/sample_covariance.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace allocation
{
    namespace risk
    {

        CovarianceEstimator::CovarianceEstimator(double eigenvalue_floor,
                                                 std::shared_ptr<const RiskModel> model)
            : eigenvalue_floor_(eigenvalue_floor), model_(std::move(model))
        {
            if (!(eigenvalue_floor_ > 0.0))
            {
                throw std::invalid_argument(
                    "Eigenvalue floor must be positive, got: " + std::to_string(eigenvalue_floor_));
            }

            if (!model_)
            {
                model_ = std::make_shared<SampleCovariance>(true);
            }
        }

        Eigen::MatrixXd CovarianceEstimator::build_return_matrix(
            const std::vector<Eigen::VectorXd> &returns)
        {
            if (returns.empty())
            {
                throw std::invalid_argument("Cannot build return matrix from an empty asset list.");
            }

            Eigen::Index length = returns.front().size();
            for (const auto &r : returns)
            {
                length = std::min(length, r.size());
            }

            if (length == 0)
            {
                throw std::invalid_argument("Cannot build return matrix: an asset has no returns.");
            }

            Eigen::MatrixXd matrix(static_cast<Eigen::Index>(returns.size()), length);
            for (size_t i = 0; i < returns.size(); ++i)
            {
                matrix.row(static_cast<Eigen::Index>(i)) = returns[i].head(length).transpose();
            }

            return matrix;
        }

        Eigen::MatrixXd CovarianceEstimator::estimate(const Eigen::MatrixXd &return_matrix) const
        {
            // RiskModel expects observations in rows
            Eigen::MatrixXd raw = model_->estimate_covariance(return_matrix.transpose());
            return repair(raw);
        }

        Eigen::MatrixXd CovarianceEstimator::repair(const Eigen::MatrixXd &covariance) const
        {
            if (covariance.rows() != covariance.cols())
            {
                throw std::invalid_argument(
                    "Covariance matrix must be square. Got " + std::to_string(covariance.rows()) +
                    "x" + std::to_string(covariance.cols()));
            }

            if (covariance.size() == 0)
            {
                return covariance;
            }

            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(covariance);
            if (solver.info() != Eigen::Success)
            {
                std::cerr << "Warning: eigen-decomposition of covariance matrix failed; "
                          << "using unrepaired matrix\n";
                return covariance;
            }

            Eigen::VectorXd eigenvalues = solver.eigenvalues().cwiseMax(eigenvalue_floor_);
            const Eigen::MatrixXd &vectors = solver.eigenvectors();

            Eigen::MatrixXd repaired = vectors * eigenvalues.asDiagonal() * vectors.transpose();

            return 0.5 * (repaired + repaired.transpose());
        }

    } // namespace risk
} // namespace allocation
