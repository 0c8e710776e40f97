/**
 * @file sharpe_improvement.cpp
 * @brief Implementation of SharpeImprovementEvaluator
 */

#include "optimizer/sharpe_improvement.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace allocation
{
    namespace optimizer
    {

        nlohmann::json SharpeImprovement::to_json() const
        {
            return nlohmann::json{
                {"baseline_sharpe", baseline_sharpe},
                {"optimized_sharpe", optimized_sharpe},
                {"improvement_ratio", improvement_ratio},
                {"target", target},
                {"target_achieved", target_achieved}};
        }

        SharpeImprovementEvaluator::SharpeImprovementEvaluator(double target)
            : target_(target)
        {
            if (!std::isfinite(target_))
            {
                throw std::invalid_argument("Sharpe improvement target must be finite, got: " +
                                            std::to_string(target_));
            }
        }

        SharpeImprovement SharpeImprovementEvaluator::evaluate(double optimized_sharpe,
                                                               double baseline_sharpe) const
        {
            SharpeImprovement improvement;
            improvement.baseline_sharpe = baseline_sharpe;
            improvement.optimized_sharpe = optimized_sharpe;
            improvement.target = target_;

            if (!std::isfinite(optimized_sharpe))
            {
                return improvement;
            }

            // No meaningful ratio: the improvement counts as zero
            if (!(baseline_sharpe > 0.0))
            {
                improvement.target_achieved = 0.0 >= target_;
                return improvement;
            }

            improvement.improvement_ratio = (optimized_sharpe - baseline_sharpe) / baseline_sharpe;
            improvement.target_achieved = improvement.improvement_ratio >= target_;

            return improvement;
        }

    } // namespace optimizer
} // namespace allocation
