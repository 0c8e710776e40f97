/**
 * @file projected_gradient_solver.hpp
 * @brief Projected gradient solver for smooth objectives on the budget simplex
 *
 * Solves problems of the form:
 *
 * Minimize:     f(x)
 * Subject to:   sum(x) = budget
 *               l <= x <= u
 *
 * Algorithm: projected gradient descent with backtracking (Armijo) line
 * search along the projection arc. The Euclidean projection onto the
 * feasible set is exact, found by bisection on the shift tau of
 * clamp(x_i - tau, l_i, u_i).
 *
 * Only a local optimum is guaranteed; the iterate sequence is fully
 * deterministic for a given starting point.
 */

#pragma once

#include "solver_types.hpp"
#include <Eigen/Dense>

namespace allocation
{
    namespace optimizer
    {

        /**
         * @class ProjectedGradientSolver
         * @brief Nonlinear solver used by the max-Sharpe, Black-Litterman and
         *        equal-risk-contribution objectives
         *
         * Usage Example:
         * @code
         * NonlinearProblem problem;
         * problem.objective = [&](const Eigen::VectorXd &w) { return w.dot(cov * w); };
         * problem.lower_bounds = Eigen::VectorXd::Constant(n, 0.0);
         * problem.upper_bounds = Eigen::VectorXd::Constant(n, 1.0);
         * problem.initial_guess = Eigen::VectorXd::Constant(n, 1.0 / n);
         *
         * ProjectedGradientSolver solver;
         * SolverResult result = solver.solve(problem);
         * @endcode
         *
         * Thread Safety: Safe for concurrent read-only operations
         */
        class ProjectedGradientSolver
        {
        public:
            explicit ProjectedGradientSolver(const SolverOptions &options = SolverOptions());

            /**
             * @brief Minimize the objective
             *
             * Infeasible bounds return the initial guess with success = false
             * and zero iterations. Hitting max_iterations returns the last
             * accepted iterate with success = false.
             *
             * @throws std::invalid_argument if the problem is ill-formed
             */
            SolverResult solve(const NonlinearProblem &problem) const;

            /**
             * @brief Euclidean projection onto {sum(x) = budget, l <= x <= u}
             *
             * Requires a feasible set (see NonlinearProblem::is_feasible).
             */
            static Eigen::VectorXd project(const Eigen::VectorXd &x,
                                           const Eigen::VectorXd &lower,
                                           const Eigen::VectorXd &upper,
                                           double budget);

            /**
             * @brief Central-difference gradient
             */
            static Eigen::VectorXd numerical_gradient(const NonlinearProblem &problem,
                                                      const Eigen::VectorXd &x);

        private:
            SolverOptions options_; ///< Solver configuration

            Eigen::VectorXd compute_gradient(const NonlinearProblem &problem,
                                             const Eigen::VectorXd &x) const;
        };

    } // namespace optimizer
} // namespace allocation
