/**
 * @file weight_optimizer.hpp
 * @brief Constrained portfolio weight optimizer with five objective profiles
 *
 * Every profile shares the constraint shape sum(w) = 1 and
 * min_weight <= w_i <= max_weight, and starts from the equal-weight vector.
 *
 * Profiles:
 *  - MAX_SHARPE: minimize -(w^T mu - r_f) / sqrt(w^T Sigma w), projected gradient
 *  - MEAN_VARIANCE: minimize w^T Sigma w (optional w^T mu = target), OSQP
 *  - BLACK_LITTERMAN: max-Sharpe on risk_aversion * Sigma * w_market
 *  - RISK_PARITY: closed form w_i proportional to 1 / sqrt(Sigma_ii)
 *  - EQUAL_RISK_CONTRIBUTION: minimize the variance of w_i (Sigma w)_i / sigma_p
 *
 * Non-convergence is never an exception: the last iterate (or the initial
 * guess when no finite iterate exists) is returned with converged = false.
 */

#pragma once

#include "optimizer_interface.hpp"
#include "solver_types.hpp"
#include "core/config.hpp"

namespace allocation
{
    namespace optimizer
    {

        /**
         * @class WeightOptimizer
         * @brief OptimizerInterface implementation covering every objective profile
         *
         * Usage Example:
         * @code
         * WeightOptimizer optimizer(OptimizationMethod::MAX_SHARPE, config);
         * OptimizationConstraints constraints;
         * constraints.max_weight = 0.5;
         * WeightSolution solution = optimizer.optimize(mu, covariance, constraints);
         * if (!solution.converged) {
         *     // still usable; confidence is discounted downstream
         * }
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class WeightOptimizer : public OptimizerInterface
        {
        public:
            /**
             * @param method Objective profile
             * @param config Iteration cap, tolerance, risk-free rate and BL risk aversion
             * @param market_weights Market portfolio for Black-Litterman (equal weights if empty)
             * @throws std::invalid_argument if market_weights contains NaN/Inf or negative values
             */
            explicit WeightOptimizer(OptimizationMethod method,
                                     const OptimizerConfig &config = OptimizerConfig(),
                                     const Eigen::VectorXd &market_weights = Eigen::VectorXd());

            WeightSolution optimize(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const override;

            std::string get_name() const override;

            nlohmann::json get_parameters() const override;

            OptimizationMethod method() const { return method_; }

            /**
             * @brief Negative Sharpe ratio; -inf when the volatility is exactly 0
             */
            static double negative_sharpe(const Eigen::VectorXd &weights,
                                          const Eigen::VectorXd &expected_returns,
                                          const Eigen::MatrixXd &covariance,
                                          double risk_free_rate);

            /**
             * @brief Risk contributions w_i (Sigma w)_i / sigma_p (zeros if sigma_p is 0)
             */
            static Eigen::VectorXd risk_contributions(const Eigen::VectorXd &weights,
                                                      const Eigen::MatrixXd &covariance);

            /**
             * @brief Population variance of the risk contributions
             */
            static double risk_contribution_dispersion(const Eigen::VectorXd &weights,
                                                       const Eigen::MatrixXd &covariance);

        private:
            OptimizationMethod method_;
            OptimizerConfig config_;
            Eigen::VectorXd market_weights_;

            SolverOptions solver_options() const;

            WeightSolution optimize_max_sharpe(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const;

            WeightSolution optimize_mean_variance(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const;

            WeightSolution optimize_black_litterman(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const;

            WeightSolution optimize_risk_parity(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance) const;

            WeightSolution optimize_equal_risk_contribution(
                const Eigen::VectorXd &expected_returns,
                const Eigen::MatrixXd &covariance,
                const OptimizationConstraints &constraints) const;

            /**
             * @brief Copy solver output into a solution, falling back to the
             *        initial guess when the solver produced no finite iterate
             */
            WeightSolution from_solver(const SolverResult &result,
                                       const Eigen::VectorXd &initial_guess) const;

            void warn_if_not_converged(const WeightSolution &solution) const;
        };

    } // namespace optimizer
} // namespace allocation
