/**
 * @file result_post_processor.hpp
 * @brief Turns a raw WeightSolution into the final OptimizationResult
 *
 * Steps: normalize and clamp the weights into the configured bounds,
 * recompute portfolio statistics for the final weights, score
 * diversification, classify the risk level and derive a confidence value
 * from the solver outcome.
 */

#pragma once

#include "optimizer_interface.hpp"
#include "optimization_result.hpp"
#include "core/config.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @class ResultPostProcessor
         * @brief Bound enforcement, diversification, risk level and confidence
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class ResultPostProcessor
        {
        public:
            static constexpr double RISK_PARITY_CONFIDENCE = 0.8; ///< Fixed confidence of the closed form

            explicit ResultPostProcessor(const OptimizerConfig &config = OptimizerConfig());

            /**
             * @brief Normalize, then min-clamp and renormalize, then max-clamp and renormalize
             *
             * Each clamp pass runs only if some weight is outside that bound.
             * The second renormalization can push weights slightly back across
             * the min bound (or above max when the bounds are infeasible).
             *
             * @throws std::invalid_argument if the weights are empty, non-finite
             *         or do not have a positive sum
             */
            Eigen::VectorXd enforce_bounds(const Eigen::VectorXd &weights) const;

            /**
             * @brief (H / log n) * (weighted asset vol / portfolio vol), clamped to [0, 1]
             *
             * H = -sum(w_hat * log(w_hat + 1e-10)) over the normalized weights.
             * A single-asset portfolio scores 0; a zero weighted volatility
             * uses a correlation penalty of 1.
             */
            static double diversification_score(const Eigen::VectorXd &weights,
                                                const Eigen::MatrixXd &covariance);

            /**
             * @brief <= 0.10 LOW, <= 0.20 MEDIUM, <= 0.30 HIGH, else VERY_HIGH
             */
            static RiskLevel classify_risk(double volatility);

            /**
             * @brief ((converged ? 1 : 0.5) + max(0.5, 1 - iterations / max_iterations)) / 2
             */
            double confidence(bool converged, int iterations) const;

            /**
             * @brief Build the final result for the given universe
             * @param solution Raw solver output
             * @param symbols Asset symbols in universe order
             * @param expected_returns Returns used for the reported statistics
             * @param covariance Repaired covariance matrix
             * @throws std::invalid_argument on size mismatch
             */
            OptimizationResult finalize(const WeightSolution &solution,
                                        const std::vector<std::string> &symbols,
                                        const Eigen::VectorXd &expected_returns,
                                        const Eigen::MatrixXd &covariance) const;

        private:
            double min_weight_;
            double max_weight_;
            int max_iterations_;
            double risk_free_rate_;
        };

    } // namespace optimizer
} // namespace allocation
