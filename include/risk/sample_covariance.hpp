/**
 * @file sample_covariance.hpp
 * @brief Classical sample covariance estimator
 *
 * Formula (with bias correction):
 *     Cov = (1/(n-1)) * (X - mean(X))^T * (X - mean(X))
 *
 * Raw sample covariance from short windows is frequently near-singular;
 * CovarianceEstimator repairs the output before it reaches the optimizer.
 */

#pragma once

#include "risk_model.hpp"

namespace allocation
{
    namespace risk
    {

        /**
         * @class SampleCovariance
         * @brief Sample covariance matrix estimator
         *
         * Supports bias correction via Bessel's correction (dividing by n-1
         * instead of n), which is the default.
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class SampleCovariance : public RiskModel
        {
        public:
            /**
             * @param bias_correction Apply Bessel's correction (divide by n-1 vs n)
             */
            explicit SampleCovariance(bool bias_correction = true);

            ~SampleCovariance() override = default;

            /**
             * @brief Estimate covariance matrix
             * @param returns Matrix of returns (T x N: observations x assets)
             * @return Covariance matrix (N x N)
             * @throws std::invalid_argument if returns is empty or has < 2 observations
             */
            Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const override;

            /**
             * @return "SampleCovariance"
             */
            std::string get_name() const override;

            bool uses_bias_correction() const { return bias_correction_; }

        private:
            bool bias_correction_; ///< Whether to apply Bessel's correction
        };

    } // namespace risk
} // namespace allocation
