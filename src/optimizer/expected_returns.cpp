/**
 * @file expected_returns.cpp
 * @brief Implementation of ExpectedReturnEstimator
 */

#include "optimizer/expected_returns.hpp"
#include <stdexcept>
#include <string>

namespace allocation
{
    namespace optimizer
    {

        constexpr double ExpectedReturnEstimator::RETURN_CLIP;
        constexpr double ExpectedReturnEstimator::VOLATILITY_FLOOR;

        ExpectedReturnEstimator::ExpectedReturnEstimator(const OptimizerConfig &config)
            : trading_days_per_year_(config.trading_days_per_year)
        {
        }

        Eigen::VectorXd ExpectedReturnEstimator::annualized_means(const Eigen::MatrixXd &return_matrix) const
        {
            if (return_matrix.rows() == 0 || return_matrix.cols() == 0)
            {
                throw std::invalid_argument("Return matrix cannot be empty.");
            }

            return return_matrix.rowwise().mean() * static_cast<double>(trading_days_per_year_);
        }

        Eigen::VectorXd ExpectedReturnEstimator::historical_risk_adjusted(
            const Eigen::MatrixXd &return_matrix,
            const Eigen::VectorXd &volatilities) const
        {
            if (volatilities.size() != return_matrix.rows())
            {
                throw std::invalid_argument(
                    "Volatility vector size (" + std::to_string(volatilities.size()) +
                    ") does not match number of assets (" + std::to_string(return_matrix.rows()) + ")");
            }

            Eigen::VectorXd annual = annualized_means(return_matrix);
            Eigen::VectorXd adjusted(annual.size());

            for (Eigen::Index i = 0; i < annual.size(); ++i)
            {
                const double vol = volatilities(i) == 0.0 ? VOLATILITY_FLOOR : volatilities(i);
                adjusted(i) = annual(i) / vol;
            }

            return adjusted.cwiseMax(-RETURN_CLIP).cwiseMin(RETURN_CLIP);
        }

        double ExpectedReturnEstimator::market_implied_return(const Eigen::VectorXd &market_weights,
                                                              const Eigen::VectorXd &annualized_returns)
        {
            if (market_weights.size() == 0)
            {
                return equal_weights(annualized_returns.size()).dot(annualized_returns);
            }

            if (market_weights.size() != annualized_returns.size())
            {
                throw std::invalid_argument(
                    "Market weights size (" + std::to_string(market_weights.size()) +
                    ") does not match returns size (" + std::to_string(annualized_returns.size()) + ")");
            }

            return market_weights.dot(annualized_returns);
        }

        Eigen::VectorXd ExpectedReturnEstimator::black_litterman_returns(const Eigen::MatrixXd &covariance,
                                                                         const Eigen::VectorXd &market_weights,
                                                                         double risk_aversion)
        {
            const Eigen::Index n = covariance.rows();

            if (covariance.cols() != n)
            {
                throw std::invalid_argument("Covariance matrix must be square");
            }

            if (market_weights.size() == 0)
            {
                return risk_aversion * covariance * equal_weights(n);
            }

            if (market_weights.size() != n)
            {
                throw std::invalid_argument(
                    "Market weights size (" + std::to_string(market_weights.size()) +
                    ") does not match covariance dimension (" + std::to_string(n) + ")");
            }

            return risk_aversion * covariance * market_weights;
        }

        Eigen::VectorXd ExpectedReturnEstimator::equal_weights(Eigen::Index n)
        {
            if (n <= 0)
            {
                return Eigen::VectorXd();
            }
            return Eigen::VectorXd::Constant(n, 1.0 / static_cast<double>(n));
        }

    } // namespace optimizer
} // namespace allocation
