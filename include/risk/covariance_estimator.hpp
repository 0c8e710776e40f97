/**
 * @file covariance_estimator.hpp
 * @brief Return-matrix assembly and positive-definite covariance estimation
 *
 * Wraps a RiskModel (sample covariance by default) and repairs its output by
 * flooring the eigenvalues, so that w^T * Sigma * w is strictly positive for
 * every non-zero weight vector.
 */

#pragma once

#include "risk_model.hpp"
#include <memory>
#include <vector>

namespace allocation
{
    namespace risk
    {

        /**
         * @class CovarianceEstimator
         * @brief Builds the return matrix and a repaired covariance matrix
         *
         * Return matrices handled here are laid out assets x observations
         * (one row per asset). The wrapped RiskModel receives the transpose.
         *
         * Usage Example:
         * @code
         * CovarianceEstimator estimator(1e-8);
         * Eigen::MatrixXd R = CovarianceEstimator::build_return_matrix(series_returns);
         * Eigen::MatrixXd cov = estimator.estimate(R);
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class CovarianceEstimator
        {
        public:
            /**
             * @param eigenvalue_floor Minimum eigenvalue after repair (must be > 0)
             * @param model Covariance model; SampleCovariance with Bessel's correction if null
             * @throws std::invalid_argument if eigenvalue_floor is not positive
             */
            explicit CovarianceEstimator(double eigenvalue_floor = 1e-8,
                                         std::shared_ptr<const RiskModel> model = nullptr);

            /**
             * @brief Stack return vectors as rows, truncated to the shortest one
             *
             * Truncation keeps the leading observations of every vector.
             *
             * @throws std::invalid_argument if the list is empty or any vector is empty
             */
            static Eigen::MatrixXd build_return_matrix(const std::vector<Eigen::VectorXd> &returns);

            /**
             * @brief Covariance of an assets x observations return matrix, repaired
             * @throws std::invalid_argument if fewer than 2 observations or non-finite values
             */
            Eigen::MatrixXd estimate(const Eigen::MatrixXd &return_matrix) const;

            /**
             * @brief Floor eigenvalues and rebuild V * diag(lambda') * V^T
             *
             * Returns the input unchanged (with a warning) if the
             * eigen-decomposition fails.
             *
             * @throws std::invalid_argument if the matrix is not square
             */
            Eigen::MatrixXd repair(const Eigen::MatrixXd &covariance) const;

            double eigenvalue_floor() const { return eigenvalue_floor_; }

            const RiskModel &model() const { return *model_; }

        private:
            double eigenvalue_floor_;
            std::shared_ptr<const RiskModel> model_;
        };

    } // namespace risk
} // namespace allocation
