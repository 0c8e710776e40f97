/**
 * @file portfolio_optimizer.hpp
 * @brief End-to-end optimization pipeline with an explicit outcome type
 *
 * Pipeline:
 *   ReturnSeriesBuilder -> CovarianceEstimator + ExpectedReturnEstimator
 *   -> WeightOptimizer -> ResultPostProcessor -> SharpeImprovementEvaluator
 *
 * The pipeline never throws from optimize(): insufficient data and
 * unexpected failures are reported through OutcomeStatus, always together
 * with a structurally valid (neutral) OptimizationResult.
 */

#pragma once

#include "optimization_result.hpp"
#include "optimizer_interface.hpp"
#include "sharpe_improvement.hpp"
#include "analytics/risk_metrics.hpp"
#include "core/config.hpp"
#include "data/asset_series.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @struct OptimizationRequest
         * @brief Inputs of one optimization call
         */
        struct OptimizationRequest
        {
            std::vector<data::AssetRecord> assets;
            OptimizationMethod method = OptimizationMethod::MAX_SHARPE;
            std::optional<double> target_return;          ///< Mean-variance only
            std::map<std::string, double> market_weights; ///< Black-Litterman only; equal weights if empty
            std::map<std::string, double> current_weights; ///< Current holdings; Sharpe baseline when set
        };

        /**
         * @enum OutcomeStatus
         * @brief Which path produced the outcome
         */
        enum class OutcomeStatus
        {
            OPTIMIZED,         ///< Solver ran; check result.convergence for solver success
            INSUFFICIENT_DATA, ///< No asset had enough valid prices
            FAILED             ///< A stage raised an error; result is neutral
        };

        std::string to_string(OutcomeStatus status);

        /**
         * @struct OptimizationOutcome
         * @brief Result of PortfolioOptimizer::optimize
         */
        struct OptimizationOutcome
        {
            OutcomeStatus status = OutcomeStatus::FAILED;
            OptimizationResult result;
            SharpeImprovement sharpe_improvement;
            std::string message;

            bool ok() const { return status == OutcomeStatus::OPTIMIZED; }

            nlohmann::json to_json() const;
        };

        /**
         * @class PortfolioOptimizer
         * @brief Facade running the complete optimization pipeline
         *
         * Usage Example:
         * @code
         * OptimizerConfig config;
         * config.max_position_weight = 0.5;
         * PortfolioOptimizer optimizer(config);
         *
         * OptimizationRequest request;
         * request.assets = records;
         * OptimizationOutcome outcome = optimizer.optimize(request);
         * if (outcome.ok()) {
         *     outcome.result.print_summary();
         * }
         * @endcode
         *
         * Thread Safety: All operations are const and share no mutable state
         */
        class PortfolioOptimizer
        {
        public:
            /**
             * @throws std::invalid_argument if the configuration is invalid
             */
            explicit PortfolioOptimizer(const OptimizerConfig &config = OptimizerConfig());

            /**
             * @brief Run the pipeline; never throws
             */
            OptimizationOutcome optimize(const OptimizationRequest &request) const;

            /**
             * @brief Risk metrics of the given weights over the records' return history
             *
             * A weighted symbol that is missing from the records (or has too
             * few prices), an empty weight vector, or any error yields the
             * neutral RiskMetrics.
             */
            analytics::RiskMetrics evaluate_risk(const WeightVector &weights,
                                                 const std::vector<data::AssetRecord> &records,
                                                 const std::vector<double> &benchmark = {}) const;

            const OptimizerConfig &config() const { return config_; }

        private:
            OptimizerConfig config_;

            OptimizationOutcome run(const OptimizationRequest &request) const;

            Eigen::VectorXd align_market_weights(const std::map<std::string, double> &market_weights,
                                                 const std::vector<std::string> &symbols) const;

            /**
             * @brief Weights the Sharpe improvement is measured against
             *
             * The current holdings restricted to the universe and renormalized;
             * the equal-weight portfolio when no holding is in the universe.
             */
            Eigen::VectorXd baseline_weights(const std::map<std::string, double> &current_weights,
                                             const std::vector<std::string> &symbols) const;

            static Eigen::VectorXd align_weights(const std::map<std::string, double> &weights,
                                                 const std::vector<std::string> &symbols);
        };

    } // namespace optimizer
} // namespace allocation
