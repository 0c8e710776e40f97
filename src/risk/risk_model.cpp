/**
 * @file risk_model.cpp
 * @brief Implementation of RiskModel base class utilities
 */

#include "risk/risk_model.hpp"
#include <stdexcept>

namespace allocation
{
    namespace risk
    {

        void RiskModel::validate_returns(const Eigen::MatrixXd &returns)
        {
            if (returns.rows() == 0 || returns.cols() == 0)
            {
                throw std::invalid_argument("Returns matrix cannot be empty.");
            }

            if (returns.rows() < 2)
            {
                throw std::invalid_argument(
                    "Not enough observations to compute risk model. Returns matrix must have "
                    "at least 2 observations for covariance estimation. Received: " +
                    std::to_string(returns.rows()));
            }

            if (!returns.allFinite())
            {
                throw std::invalid_argument("Returns matrix contains NaN or Inf values.");
            }
        }

        Eigen::MatrixXd RiskModel::ensure_symmetric(const Eigen::MatrixXd &matrix)
        {
            return 0.5 * (matrix + matrix.transpose());
        }

    } // namespace risk
} // namespace allocation
