/**
 * @file result_post_processor.cpp
 * @brief Implementation of ResultPostProcessor
 */

#include "optimizer/result_post_processor.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace allocation
{
    namespace optimizer
    {

        constexpr double ResultPostProcessor::RISK_PARITY_CONFIDENCE;

        ResultPostProcessor::ResultPostProcessor(const OptimizerConfig &config)
            : min_weight_(config.min_position_weight),
              max_weight_(config.max_position_weight),
              max_iterations_(config.max_iterations),
              risk_free_rate_(config.risk_free_rate)
        {
        }

        Eigen::VectorXd ResultPostProcessor::enforce_bounds(const Eigen::VectorXd &weights) const
        {
            if (weights.size() == 0)
            {
                throw std::invalid_argument("Cannot enforce bounds on an empty weight vector");
            }

            if (!weights.allFinite())
            {
                throw std::invalid_argument("Weights contain NaN or Inf values");
            }

            const double total = weights.sum();
            if (!(total > 0.0))
            {
                throw std::invalid_argument("Weights must have a positive sum, got: " + std::to_string(total));
            }

            Eigen::VectorXd adjusted = weights / total;

            if ((adjusted.array() < min_weight_).any())
            {
                adjusted = adjusted.cwiseMax(min_weight_);
                adjusted /= adjusted.sum();
            }

            if ((adjusted.array() > max_weight_).any())
            {
                adjusted = adjusted.cwiseMin(max_weight_);
                adjusted /= adjusted.sum();
            }

            return adjusted;
        }

        double ResultPostProcessor::diversification_score(const Eigen::VectorXd &weights,
                                                          const Eigen::MatrixXd &covariance)
        {
            const Eigen::Index n = weights.size();
            if (n <= 1)
            {
                return 0.0;
            }

            const double total = weights.sum();
            if (!(total > 0.0))
            {
                return 0.0;
            }

            Eigen::ArrayXd normalized = weights.array() / total;
            const double entropy = -(normalized * (normalized + 1e-10).log()).sum();
            const double max_entropy = std::log(static_cast<double>(n));

            const double portfolio_volatility = std::sqrt(std::max(0.0, weights.dot(covariance * weights)));
            const double weighted_volatility = weights.dot(covariance.diagonal().cwiseMax(0.0).cwiseSqrt());

            double correlation_penalty = weighted_volatility > 0.0
                                             ? portfolio_volatility / weighted_volatility
                                             : 1.0;

            if (!(correlation_penalty > 0.0))
            {
                return 0.0;
            }

            const double score = (entropy / max_entropy) * (1.0 / correlation_penalty);
            if (!std::isfinite(score))
            {
                return 0.0;
            }

            return std::min(1.0, std::max(0.0, score));
        }

        RiskLevel ResultPostProcessor::classify_risk(double volatility)
        {
            if (volatility <= 0.10)
                return RiskLevel::LOW;
            if (volatility <= 0.20)
                return RiskLevel::MEDIUM;
            if (volatility <= 0.30)
                return RiskLevel::HIGH;
            return RiskLevel::VERY_HIGH;
        }

        double ResultPostProcessor::confidence(bool converged, int iterations) const
        {
            const double convergence_score = converged ? 1.0 : 0.5;
            const double iteration_score =
                std::max(0.5, 1.0 - static_cast<double>(iterations) / static_cast<double>(max_iterations_));

            return std::min(1.0, std::max(0.0, (convergence_score + iteration_score) / 2.0));
        }

        OptimizationResult ResultPostProcessor::finalize(const WeightSolution &solution,
                                                         const std::vector<std::string> &symbols,
                                                         const Eigen::VectorXd &expected_returns,
                                                         const Eigen::MatrixXd &covariance) const
        {
            const Eigen::Index n = solution.weights.size();

            if (static_cast<Eigen::Index>(symbols.size()) != n ||
                expected_returns.size() != n ||
                covariance.rows() != n || covariance.cols() != n)
            {
                throw std::invalid_argument(
                    "Post-processing inputs disagree on the number of assets (" + std::to_string(n) + ")");
            }

            Eigen::VectorXd weights = enforce_bounds(solution.weights);

            OptimizationResult result;
            result.weights = WeightVector(symbols, weights);
            result.method = to_string(solution.method);
            result.iterations = solution.iterations;
            result.convergence = solution.converged;

            const Eigen::VectorXd &final_weights = result.weights.values();
            result.expected_return = final_weights.dot(expected_returns);
            result.volatility = std::sqrt(std::max(0.0, final_weights.dot(covariance * final_weights)));
            result.sharpe_ratio = result.volatility > 0.0
                                      ? (result.expected_return - risk_free_rate_) / result.volatility
                                      : 0.0;

            result.diversification_score = diversification_score(final_weights, covariance);
            result.risk_level = classify_risk(result.volatility);
            result.confidence = solution.method == OptimizationMethod::RISK_PARITY
                                    ? RISK_PARITY_CONFIDENCE
                                    : confidence(solution.converged, solution.iterations);
            result.timestamp = current_timestamp();

            return result;
        }

    } // namespace optimizer
} // namespace allocation
