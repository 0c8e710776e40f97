/**
 * @file risk_model.hpp
 * @brief Abstract interface for covariance estimation methods
 *
 * Provides a common interface for covariance estimators used by the
 * allocation engine. All risk models must implement estimate_covariance.
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace allocation
{
    namespace risk
    {

        /**
         * @class RiskModel
         * @brief Abstract base class for risk model estimation
         *
         * Usage Example:
         * @code
         * std::shared_ptr<const RiskModel> model = std::make_shared<SampleCovariance>(true);
         * Eigen::MatrixXd cov = model->estimate_covariance(observations);
         * @endcode
         */
        class RiskModel
        {
        public:
            virtual ~RiskModel() = default;

            /**
             * @brief Estimate covariance matrix from return data
             * @param returns Matrix of returns (rows = observations, cols = assets)
             * @return Covariance matrix (n_assets x n_assets)
             * @throws std::invalid_argument if returns matrix is empty
             *
             * @note The returned matrix is guaranteed to be symmetric
             * @note Matrix may not be positive definite for all estimators
             */
            virtual Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const = 0;

            /**
             * @brief Get the name of the risk model
             */
            virtual std::string get_name() const = 0;

        protected:
            /**
             * @brief Validate input returns matrix
             * @throws std::invalid_argument if empty, < 2 observations, or non-finite
             */
            static void validate_returns(const Eigen::MatrixXd &returns);

            /**
             * @brief Enforce exact symmetry: (M + M^T) / 2
             */
            static Eigen::MatrixXd ensure_symmetric(const Eigen::MatrixXd &matrix);
        };

    } // namespace risk
} // namespace allocation
