/**
 * @file portfolio_optimizer.cpp
 * @brief Implementation of the optimization pipeline facade
 */

#include "optimizer/portfolio_optimizer.hpp"
#include "optimizer/expected_returns.hpp"
#include "optimizer/result_post_processor.hpp"
#include "optimizer/weight_optimizer.hpp"
#include "risk/covariance_estimator.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace allocation
{
    namespace optimizer
    {

        std::string to_string(OutcomeStatus status)
        {
            switch (status)
            {
            case OutcomeStatus::OPTIMIZED:
                return "OPTIMIZED";
            case OutcomeStatus::INSUFFICIENT_DATA:
                return "INSUFFICIENT_DATA";
            case OutcomeStatus::FAILED:
                return "FAILED";
            }
            return "FAILED";
        }

        nlohmann::json OptimizationOutcome::to_json() const
        {
            return nlohmann::json{
                {"status", to_string(status)},
                {"message", message},
                {"result", result.to_json()},
                {"sharpe_improvement", sharpe_improvement.to_json()}};
        }

        PortfolioOptimizer::PortfolioOptimizer(const OptimizerConfig &config)
            : config_(config)
        {
            config_.validate();
        }

        OptimizationOutcome PortfolioOptimizer::optimize(const OptimizationRequest &request) const
        {
            try
            {
                return run(request);
            }
            catch (const std::exception &e)
            {
                std::cerr << "Error: " << to_string(request.method)
                          << " optimization failed: " << e.what() << "\n";

                OptimizationOutcome outcome;
                outcome.status = OutcomeStatus::FAILED;
                outcome.result = OptimizationResult::neutral(to_string(request.method));
                outcome.sharpe_improvement.target = config_.sharpe_improvement_target;
                outcome.message = e.what();
                return outcome;
            }
        }

        OptimizationOutcome PortfolioOptimizer::run(const OptimizationRequest &request) const
        {
            const std::string method_name = to_string(request.method);

            // [1] Return series
            data::ReturnSeriesBuilder builder(config_);
            std::vector<data::AssetSeries> universe = builder.build_universe(request.assets);

            if (universe.empty())
            {
                OptimizationOutcome outcome;
                outcome.status = OutcomeStatus::INSUFFICIENT_DATA;
                outcome.result = OptimizationResult::neutral(method_name);
                outcome.sharpe_improvement.target = config_.sharpe_improvement_target;
                outcome.message = "No asset has at least " + std::to_string(config_.min_price_points) +
                                  " valid prices";
                return outcome;
            }

            const Eigen::Index n = static_cast<Eigen::Index>(universe.size());
            std::vector<std::string> symbols;
            std::vector<Eigen::VectorXd> returns;
            Eigen::VectorXd volatilities(n);

            symbols.reserve(universe.size());
            returns.reserve(universe.size());
            for (Eigen::Index i = 0; i < n; ++i)
            {
                const auto &series = universe[static_cast<size_t>(i)];
                symbols.push_back(series.symbol);
                returns.push_back(series.returns);
                volatilities(i) = series.volatility;
            }

            // [2] Covariance and expected returns
            Eigen::MatrixXd return_matrix = risk::CovarianceEstimator::build_return_matrix(returns);
            risk::CovarianceEstimator estimator(config_.eigenvalue_floor);
            Eigen::MatrixXd covariance = estimator.estimate(return_matrix);

            ExpectedReturnEstimator return_estimator(config_);
            Eigen::VectorXd expected_returns = return_estimator.historical_risk_adjusted(return_matrix, volatilities);

            // [3] Weights
            OptimizationConstraints constraints;
            constraints.min_weight = config_.min_position_weight;
            constraints.max_weight = config_.max_position_weight;
            constraints.target_return = request.target_return;

            const Eigen::VectorXd market_weights = align_market_weights(request.market_weights, symbols);
            WeightOptimizer optimizer(request.method, config_, market_weights);
            WeightSolution solution = optimizer.optimize(expected_returns, covariance, constraints);

            std::string message = solution.message;
            if (request.method == OptimizationMethod::BLACK_LITTERMAN)
            {
                const double market_return = ExpectedReturnEstimator::market_implied_return(
                    market_weights, return_estimator.annualized_means(return_matrix));
                message += " (market-implied return " + std::to_string(market_return) + ")";
            }

            // [4] Post-processing
            ResultPostProcessor post_processor(config_);
            OptimizationResult result = post_processor.finalize(solution, symbols, solution.return_vector, covariance);

            // [5] Sharpe improvement against the current holdings (or equal weights)
            WeightSolution baseline;
            baseline.weights = baseline_weights(request.current_weights, symbols);
            OptimizerInterface::calculate_statistics(baseline, solution.return_vector, covariance,
                                                     config_.risk_free_rate);

            SharpeImprovementEvaluator evaluator(config_.sharpe_improvement_target);
            SharpeImprovement improvement = evaluator.evaluate(result.sharpe_ratio, baseline.sharpe_ratio);

            if (!improvement.target_achieved && config_.verbose)
            {
                std::cerr << "Warning: Sharpe improvement " << improvement.improvement_ratio
                          << " below target " << improvement.target << "\n";
            }

            OptimizationOutcome outcome;
            outcome.status = OutcomeStatus::OPTIMIZED;
            outcome.result = std::move(result);
            outcome.sharpe_improvement = improvement;
            outcome.message = message;
            return outcome;
        }

        Eigen::VectorXd PortfolioOptimizer::align_weights(const std::map<std::string, double> &weights,
                                                          const std::vector<std::string> &symbols)
        {
            Eigen::VectorXd aligned = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(symbols.size()));
            for (size_t i = 0; i < symbols.size(); ++i)
            {
                auto it = weights.find(symbols[i]);
                if (it != weights.end())
                {
                    aligned(static_cast<Eigen::Index>(i)) = it->second;
                }
            }
            return aligned;
        }

        Eigen::VectorXd PortfolioOptimizer::align_market_weights(
            const std::map<std::string, double> &market_weights,
            const std::vector<std::string> &symbols) const
        {
            if (market_weights.empty())
            {
                return Eigen::VectorXd();
            }

            Eigen::VectorXd aligned = align_weights(market_weights, symbols);

            const double total = aligned.sum();
            if (!(total > 0.0) || !std::isfinite(total))
            {
                throw std::invalid_argument("Market weights do not cover the optimization universe");
            }

            return aligned / total;
        }

        Eigen::VectorXd PortfolioOptimizer::baseline_weights(
            const std::map<std::string, double> &current_weights,
            const std::vector<std::string> &symbols) const
        {
            const Eigen::Index n = static_cast<Eigen::Index>(symbols.size());
            if (current_weights.empty())
            {
                return ExpectedReturnEstimator::equal_weights(n);
            }

            Eigen::VectorXd aligned = align_weights(current_weights, symbols);

            const double total = aligned.sum();
            if (!(total > 0.0) || !std::isfinite(total) || (aligned.array() < 0.0).any())
            {
                std::cerr << "Warning: current holdings do not cover the optimization universe; "
                          << "measuring improvement against equal weights\n";
                return ExpectedReturnEstimator::equal_weights(n);
            }

            return aligned / total;
        }

        analytics::RiskMetrics PortfolioOptimizer::evaluate_risk(const WeightVector &weights,
                                                                 const std::vector<data::AssetRecord> &records,
                                                                 const std::vector<double> &benchmark) const
        {
            analytics::RiskMetrics neutral;
            if (weights.empty())
            {
                return neutral;
            }

            try
            {
                data::ReturnSeriesBuilder builder(config_);
                std::vector<data::AssetSeries> universe = builder.build_universe(records);

                std::vector<Eigen::VectorXd> returns;
                returns.reserve(weights.size());

                for (const auto &symbol : weights.symbols())
                {
                    auto it = std::find_if(universe.begin(), universe.end(),
                                           [&](const data::AssetSeries &s) { return s.symbol == symbol; });
                    if (it == universe.end())
                    {
                        if (config_.verbose)
                        {
                            std::cerr << "Warning: no usable price history for " << symbol
                                      << "; risk metrics unavailable\n";
                        }
                        return neutral;
                    }
                    returns.push_back(it->returns);
                }

                Eigen::MatrixXd return_matrix = risk::CovarianceEstimator::build_return_matrix(returns);

                analytics::RiskMetricsCalculator calculator(config_);
                return calculator.calculate(weights.values(), return_matrix, benchmark);
            }
            catch (const std::exception &e)
            {
                std::cerr << "Error: risk metric calculation failed: " << e.what() << "\n";
                return neutral;
            }
        }

    } // namespace optimizer
} // namespace allocation
