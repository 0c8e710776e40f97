/**
 * @file sharpe_improvement.hpp
 * @brief Comparison of an optimized Sharpe ratio against a baseline
 */

#pragma once

#include <nlohmann/json.hpp>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @struct SharpeImprovement
         * @brief Relative improvement of the optimized Sharpe ratio
         */
        struct SharpeImprovement
        {
            double baseline_sharpe = 0.0;
            double optimized_sharpe = 0.0;
            double improvement_ratio = 0.0; ///< (optimized - baseline) / baseline
            double target = 0.0;
            bool target_achieved = false;   ///< improvement_ratio >= target

            nlohmann::json to_json() const;
        };

        /**
         * @class SharpeImprovementEvaluator
         * @brief Stateless Sharpe-improvement check
         *
         * A non-positive baseline yields a ratio of 0, and the target counts
         * as achieved only when it is itself <= 0.
         */
        class SharpeImprovementEvaluator
        {
        public:
            explicit SharpeImprovementEvaluator(double target = 0.20);

            SharpeImprovement evaluate(double optimized_sharpe, double baseline_sharpe) const;

            double target() const { return target_; }

        private:
            double target_;
        };

    } // namespace optimizer
} // namespace allocation
