/**
 * @file weight_optimizer.cpp
 * @brief Implementation of WeightOptimizer
 */

#include "optimizer/weight_optimizer.hpp"
#include "optimizer/expected_returns.hpp"
#include "optimizer/osqp_solver.hpp"
#include "optimizer/projected_gradient_solver.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

namespace allocation
{
    namespace optimizer
    {

        WeightOptimizer::WeightOptimizer(OptimizationMethod method,
                                         const OptimizerConfig &config,
                                         const Eigen::VectorXd &market_weights)
            : method_(method), config_(config), market_weights_(market_weights)
        {
            if (market_weights_.size() > 0)
            {
                if (!market_weights_.allFinite())
                {
                    throw std::invalid_argument("Market weights contain NaN or Inf values");
                }
                if ((market_weights_.array() < 0.0).any())
                {
                    throw std::invalid_argument("Market weights must be non-negative");
                }
            }
        }

        std::string WeightOptimizer::get_name() const
        {
            return "WeightOptimizer(" + to_string(method_) + ")";
        }

        nlohmann::json WeightOptimizer::get_parameters() const
        {
            nlohmann::json params = {
                {"method", to_string(method_)},
                {"max_iterations", config_.max_iterations},
                {"tolerance", config_.tolerance},
                {"risk_free_rate", config_.risk_free_rate}};

            if (method_ == OptimizationMethod::BLACK_LITTERMAN)
            {
                params["risk_aversion"] = config_.black_litterman_risk_aversion;
                params["market_weights"] = std::vector<double>(market_weights_.data(),
                                                               market_weights_.data() + market_weights_.size());
            }

            return params;
        }

        WeightSolution WeightOptimizer::optimize(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            validate_inputs(expected_returns, covariance);
            constraints.validate();

            switch (method_)
            {
            case OptimizationMethod::MAX_SHARPE:
                return optimize_max_sharpe(expected_returns, covariance, constraints);
            case OptimizationMethod::MEAN_VARIANCE:
                return optimize_mean_variance(expected_returns, covariance, constraints);
            case OptimizationMethod::BLACK_LITTERMAN:
                return optimize_black_litterman(expected_returns, covariance, constraints);
            case OptimizationMethod::RISK_PARITY:
                return optimize_risk_parity(expected_returns, covariance);
            case OptimizationMethod::EQUAL_RISK_CONTRIBUTION:
                return optimize_equal_risk_contribution(expected_returns, covariance, constraints);
            }

            throw std::invalid_argument("Unknown optimization method");
        }

        // ============================================================================
        // Objectives
        // ============================================================================

        double WeightOptimizer::negative_sharpe(const Eigen::VectorXd &weights,
                                                const Eigen::VectorXd &expected_returns,
                                                const Eigen::MatrixXd &covariance,
                                                double risk_free_rate)
        {
            const double portfolio_return = weights.dot(expected_returns);
            const double portfolio_volatility = std::sqrt(std::max(0.0, weights.dot(covariance * weights)));

            if (portfolio_volatility == 0.0)
            {
                return -std::numeric_limits<double>::infinity();
            }

            return -(portfolio_return - risk_free_rate) / portfolio_volatility;
        }

        Eigen::VectorXd WeightOptimizer::risk_contributions(const Eigen::VectorXd &weights,
                                                            const Eigen::MatrixXd &covariance)
        {
            Eigen::VectorXd marginal = covariance * weights;
            const double portfolio_volatility = std::sqrt(std::max(0.0, weights.dot(marginal)));

            if (portfolio_volatility == 0.0)
            {
                return Eigen::VectorXd::Zero(weights.size());
            }

            return weights.cwiseProduct(marginal) / portfolio_volatility;
        }

        double WeightOptimizer::risk_contribution_dispersion(const Eigen::VectorXd &weights,
                                                             const Eigen::MatrixXd &covariance)
        {
            Eigen::VectorXd contributions = risk_contributions(weights, covariance);
            if (contributions.size() == 0)
            {
                return 0.0;
            }

            const double mean = contributions.mean();
            return (contributions.array() - mean).square().mean();
        }

        // ============================================================================
        // Helpers
        // ============================================================================

        SolverOptions WeightOptimizer::solver_options() const
        {
            SolverOptions options;
            options.max_iterations = config_.max_iterations;
            options.tolerance = config_.tolerance;
            options.step_size = 1.0;
            options.verbose = false;
            return options;
        }

        WeightSolution WeightOptimizer::from_solver(const SolverResult &result,
                                                    const Eigen::VectorXd &initial_guess) const
        {
            WeightSolution solution;
            solution.method = method_;
            solution.iterations = result.iterations;
            solution.converged = result.success;
            solution.message = result.message;
            solution.objective_value = result.objective_value;

            if (result.solution.size() == initial_guess.size() && result.solution.allFinite())
            {
                solution.weights = result.solution;
            }
            else
            {
                solution.weights = initial_guess;
                solution.converged = false;
            }

            return solution;
        }

        void WeightOptimizer::warn_if_not_converged(const WeightSolution &solution) const
        {
            if (!solution.converged && config_.verbose)
            {
                std::cerr << "Warning: " << to_string(solution.method)
                          << " optimization did not converge: " << solution.message << "\n";
            }
        }

        // ============================================================================
        // Objective profiles
        // ============================================================================

        WeightSolution WeightOptimizer::optimize_max_sharpe(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            const Eigen::Index n = expected_returns.size();
            const double rf = config_.risk_free_rate;

            NonlinearProblem problem;
            problem.objective = [&](const Eigen::VectorXd &w) {
                return negative_sharpe(w, expected_returns, covariance, rf);
            };
            problem.gradient = [&](const Eigen::VectorXd &w) -> Eigen::VectorXd {
                Eigen::VectorXd marginal = covariance * w;
                const double vol = std::sqrt(std::max(0.0, w.dot(marginal)));
                if (vol == 0.0)
                {
                    return Eigen::VectorXd::Constant(w.size(), std::numeric_limits<double>::quiet_NaN());
                }
                const double excess = w.dot(expected_returns) - rf;
                // d/dw [-(excess / vol)] = -(mu / vol - excess * Sigma w / vol^3)
                return -(expected_returns / vol - excess * marginal / (vol * vol * vol));
            };
            problem.lower_bounds = Eigen::VectorXd::Constant(n, constraints.min_weight);
            problem.upper_bounds = Eigen::VectorXd::Constant(n, constraints.max_weight);
            problem.budget = 1.0;
            problem.initial_guess = ExpectedReturnEstimator::equal_weights(n);

            ProjectedGradientSolver solver(solver_options());
            SolverResult result = solver.solve(problem);

            WeightSolution solution = from_solver(result, problem.initial_guess);
            solution.method = OptimizationMethod::MAX_SHARPE;
            solution.return_vector = expected_returns;
            calculate_statistics(solution, expected_returns, covariance, rf);

            warn_if_not_converged(solution);
            return solution;
        }

        WeightSolution WeightOptimizer::optimize_mean_variance(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            const Eigen::Index n = expected_returns.size();
            const Eigen::VectorXd initial_guess = ExpectedReturnEstimator::equal_weights(n);

            SolverResult result;

            if (!constraints.is_feasible(n))
            {
                result.solution = initial_guess;
                result.objective_value = initial_guess.dot(covariance * initial_guess);
                result.message = "Infeasible bounds for " + std::to_string(n) + " assets";
            }
            else
            {
                QuadraticProblem problem;
                problem.P = 2.0 * covariance;
                problem.q = Eigen::VectorXd::Zero(n);

                const Eigen::Index n_eq = constraints.target_return ? 2 : 1;
                problem.A_eq = Eigen::MatrixXd::Zero(n_eq, n);
                problem.b_eq = Eigen::VectorXd::Zero(n_eq);
                problem.A_eq.row(0).setOnes();
                problem.b_eq(0) = 1.0;

                if (constraints.target_return)
                {
                    problem.A_eq.row(1) = expected_returns.transpose();
                    problem.b_eq(1) = *constraints.target_return;
                }

                problem.lower_bounds = Eigen::VectorXd::Constant(n, constraints.min_weight);
                problem.upper_bounds = Eigen::VectorXd::Constant(n, constraints.max_weight);

                OSQPSolver solver(solver_options());
                result = solver.solve(problem);
            }

            WeightSolution solution = from_solver(result, initial_guess);
            solution.method = OptimizationMethod::MEAN_VARIANCE;
            solution.return_vector = expected_returns;
            calculate_statistics(solution, expected_returns, covariance, config_.risk_free_rate);
            solution.objective_value = solution.volatility * solution.volatility;

            warn_if_not_converged(solution);
            return solution;
        }

        WeightSolution WeightOptimizer::optimize_black_litterman(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            Eigen::VectorXd bl_returns = ExpectedReturnEstimator::black_litterman_returns(
                covariance, market_weights_, config_.black_litterman_risk_aversion);

            WeightSolution solution = optimize_max_sharpe(bl_returns, covariance, constraints);
            solution.method = OptimizationMethod::BLACK_LITTERMAN;

            return solution;
        }

        WeightSolution WeightOptimizer::optimize_risk_parity(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance) const
        {
            Eigen::VectorXd variances = covariance.diagonal();
            if ((variances.array() <= 0.0).any())
            {
                throw std::invalid_argument("Risk parity requires strictly positive asset variances");
            }

            Eigen::VectorXd inverse_vol = variances.cwiseSqrt().cwiseInverse();

            WeightSolution solution;
            solution.method = OptimizationMethod::RISK_PARITY;
            solution.weights = inverse_vol / inverse_vol.sum();
            solution.return_vector = expected_returns;
            solution.iterations = 1;
            solution.converged = true;
            solution.message = "Closed-form inverse-volatility weights";

            calculate_statistics(solution, expected_returns, covariance, config_.risk_free_rate);
            solution.objective_value = solution.volatility * solution.volatility;

            return solution;
        }

        WeightSolution WeightOptimizer::optimize_equal_risk_contribution(
            const Eigen::VectorXd &expected_returns,
            const Eigen::MatrixXd &covariance,
            const OptimizationConstraints &constraints) const
        {
            const Eigen::Index n = expected_returns.size();

            NonlinearProblem problem;
            problem.objective = [&](const Eigen::VectorXd &w) {
                return risk_contribution_dispersion(w, covariance);
            };
            problem.lower_bounds = Eigen::VectorXd::Constant(n, constraints.min_weight);
            problem.upper_bounds = Eigen::VectorXd::Constant(n, constraints.max_weight);
            problem.budget = 1.0;
            problem.initial_guess = ExpectedReturnEstimator::equal_weights(n);

            ProjectedGradientSolver solver(solver_options());
            SolverResult result = solver.solve(problem);

            WeightSolution solution = from_solver(result, problem.initial_guess);
            solution.method = OptimizationMethod::EQUAL_RISK_CONTRIBUTION;
            solution.return_vector = expected_returns;
            calculate_statistics(solution, expected_returns, covariance, config_.risk_free_rate);

            warn_if_not_converged(solution);
            return solution;
        }

    } // namespace optimizer
} // namespace allocation
