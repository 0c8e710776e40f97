/**
 * @file expected_returns.hpp
 * @brief Expected-return policies feeding the weight optimizer
 *
 * Three interchangeable policies:
 *  - historical risk-adjusted: annualized mean / annualized volatility, clipped
 *  - market-implied: market-weighted average of the annualized returns
 *  - Black-Litterman (simplified): risk_aversion * Sigma * w_market
 *
 * The Black-Litterman variant incorporates no investor views; it is the
 * equilibrium tilt of the market portfolio only.
 */

#pragma once

#include "core/config.hpp"
#include <Eigen/Dense>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @class ExpectedReturnEstimator
         * @brief Produces per-asset expected-return vectors
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class ExpectedReturnEstimator
        {
        public:
            static constexpr double RETURN_CLIP = 0.5;        ///< Clip bound for risk-adjusted returns
            static constexpr double VOLATILITY_FLOOR = 1e-8;  ///< Replaces a zero volatility

            explicit ExpectedReturnEstimator(const OptimizerConfig &config = OptimizerConfig());

            /**
             * @brief Annualized mean of each row divided by the asset volatility
             * @param return_matrix Assets x observations log-returns
             * @param volatilities Annualized volatility per asset
             * @return Values clipped to [-0.5, 0.5]
             * @throws std::invalid_argument on size mismatch or empty input
             */
            Eigen::VectorXd historical_risk_adjusted(const Eigen::MatrixXd &return_matrix,
                                                     const Eigen::VectorXd &volatilities) const;

            /**
             * @brief Annualized mean of each row (no risk adjustment)
             */
            Eigen::VectorXd annualized_means(const Eigen::MatrixXd &return_matrix) const;

            /**
             * @brief Dot product of market weights and annualized returns
             *
             * Empty market weights mean the equal-weight market portfolio.
             */
            static double market_implied_return(const Eigen::VectorXd &market_weights,
                                                const Eigen::VectorXd &annualized_returns);

            /**
             * @brief Simplified Black-Litterman returns: risk_aversion * Sigma * w_market
             *
             * Empty market weights mean the equal-weight market portfolio.
             * @throws std::invalid_argument on size mismatch
             */
            static Eigen::VectorXd black_litterman_returns(const Eigen::MatrixXd &covariance,
                                                           const Eigen::VectorXd &market_weights,
                                                           double risk_aversion = 3.0);

            /**
             * @brief Vector of n entries equal to 1/n
             */
            static Eigen::VectorXd equal_weights(Eigen::Index n);

        private:
            int trading_days_per_year_;
        };

    } // namespace optimizer
} // namespace allocation
