/**
 * @file projected_gradient_solver.cpp
 * @brief Implementation of the projected gradient solver
 */

#include "optimizer/projected_gradient_solver.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace allocation
{
    namespace optimizer
    {

        namespace
        {
            constexpr double ARMIJO_C = 1e-4;         // Sufficient decrease parameter
            constexpr double BACKTRACK_RHO = 0.5;     // Step reduction factor
            constexpr int MAX_BACKTRACKS = 60;
            constexpr double MAX_STEP = 1e8;
            constexpr double FIXED_POINT_TOL = 1e-12;
            constexpr int PROJECTION_ITERATIONS = 100;

            double sum_clamped(const Eigen::VectorXd &x,
                               const Eigen::VectorXd &lower,
                               const Eigen::VectorXd &upper,
                               double tau)
            {
                double total = 0.0;
                for (Eigen::Index i = 0; i < x.size(); ++i)
                {
                    total += std::min(std::max(x(i) - tau, lower(i)), upper(i));
                }
                return total;
            }
        } // namespace

        ProjectedGradientSolver::ProjectedGradientSolver(const SolverOptions &options)
            : options_(options)
        {
        }

        Eigen::VectorXd ProjectedGradientSolver::project(const Eigen::VectorXd &x,
                                                         const Eigen::VectorXd &lower,
                                                         const Eigen::VectorXd &upper,
                                                         double budget)
        {
            // sum_clamped is non-increasing in tau: every coordinate sits at its
            // upper bound for tau_lo and at its lower bound for tau_hi.
            double tau_lo = (x - upper).minCoeff();
            double tau_hi = (x - lower).maxCoeff();

            for (int k = 0; k < PROJECTION_ITERATIONS; ++k)
            {
                const double tau = 0.5 * (tau_lo + tau_hi);
                if (sum_clamped(x, lower, upper, tau) > budget)
                {
                    tau_lo = tau;
                }
                else
                {
                    tau_hi = tau;
                }
            }

            const double tau = 0.5 * (tau_lo + tau_hi);
            Eigen::VectorXd projected(x.size());
            for (Eigen::Index i = 0; i < x.size(); ++i)
            {
                projected(i) = std::min(std::max(x(i) - tau, lower(i)), upper(i));
            }

            return projected;
        }

        Eigen::VectorXd ProjectedGradientSolver::numerical_gradient(const NonlinearProblem &problem,
                                                                    const Eigen::VectorXd &x)
        {
            Eigen::VectorXd gradient(x.size());
            Eigen::VectorXd probe = x;

            for (Eigen::Index i = 0; i < x.size(); ++i)
            {
                const double h = 1e-6 * std::max(1.0, std::abs(x(i)));

                probe(i) = x(i) + h;
                const double f_plus = problem.objective(probe);
                probe(i) = x(i) - h;
                const double f_minus = problem.objective(probe);
                probe(i) = x(i);

                gradient(i) = (f_plus - f_minus) / (2.0 * h);
            }

            return gradient;
        }

        Eigen::VectorXd ProjectedGradientSolver::compute_gradient(const NonlinearProblem &problem,
                                                                  const Eigen::VectorXd &x) const
        {
            if (problem.gradient)
            {
                return problem.gradient(x);
            }
            return numerical_gradient(problem, x);
        }

        SolverResult ProjectedGradientSolver::solve(const NonlinearProblem &problem) const
        {
            problem.validate();

            SolverResult result;

            if (!problem.is_feasible())
            {
                result.solution = problem.initial_guess;
                result.objective_value = problem.objective(problem.initial_guess);
                result.message = "Infeasible bounds: sum of bounds [" +
                                 std::to_string(problem.lower_bounds.sum()) + ", " +
                                 std::to_string(problem.upper_bounds.sum()) +
                                 "] excludes budget " + std::to_string(problem.budget);
                return result;
            }

            const Eigen::VectorXd &lower = problem.lower_bounds;
            const Eigen::VectorXd &upper = problem.upper_bounds;

            Eigen::VectorXd x = project(problem.initial_guess, lower, upper, problem.budget);
            double f = problem.objective(x);

            if (!std::isfinite(f))
            {
                result.solution = x;
                result.objective_value = f;
                result.message = "Objective is not finite at the starting point";
                return result;
            }

            const double f_initial = f;
            double step = options_.step_size;
            int stable_iterations = 0;
            bool finished = false;

            if (options_.verbose)
            {
                std::cout << "Starting optimization with " << x.size() << " variables\n";
            }

            for (int iter = 1; iter <= options_.max_iterations; ++iter)
            {
                result.iterations = iter;

                Eigen::VectorXd gradient = compute_gradient(problem, x);
                if (!gradient.allFinite())
                {
                    result.message = "Gradient is not finite";
                    finished = true;
                    break;
                }

                // Backtracking along the projection arc
                bool accepted = false;
                double t = step;
                Eigen::VectorXd x_new;
                double f_new = f;

                for (int bt = 0; bt < MAX_BACKTRACKS; ++bt)
                {
                    x_new = project(x - t * gradient, lower, upper, problem.budget);
                    f_new = problem.objective(x_new);

                    if (std::isfinite(f_new) &&
                        f_new <= f + ARMIJO_C * gradient.dot(x_new - x))
                    {
                        accepted = true;
                        break;
                    }
                    t *= BACKTRACK_RHO;
                }

                if (!accepted)
                {
                    const Eigen::VectorXd pg = x - project(x - gradient, lower, upper, problem.budget);
                    const double stationarity = pg.cwiseAbs().maxCoeff();
                    result.success = stationarity <= std::sqrt(options_.tolerance);
                    result.message = result.success
                                         ? "Converged (line search exhausted at stationary point)"
                                         : "Line search failed";
                    finished = true;
                    break;
                }

                const double dx = (x_new - x).cwiseAbs().maxCoeff();
                const double df = std::abs(f_new - f);

                x = x_new;
                f = f_new;

                if (options_.verbose && iter % 100 == 0)
                {
                    std::cout << "Iter " << iter << ": obj = " << f << "\n";
                }

                if (dx <= FIXED_POINT_TOL)
                {
                    result.success = true;
                    result.message = "Converged (projected step fixed point)";
                    finished = true;
                    break;
                }

                const double scale = std::max({std::abs(f_initial), std::abs(f), 1e-12});
                if (df <= options_.tolerance * scale)
                {
                    if (++stable_iterations >= 2)
                    {
                        result.success = true;
                        result.message = "Converged";
                        finished = true;
                        break;
                    }
                }
                else
                {
                    stable_iterations = 0;
                }

                step = std::min(t / BACKTRACK_RHO, MAX_STEP);
            }

            if (!finished)
            {
                result.message = "Maximum iterations reached";
            }

            result.solution = x;
            result.objective_value = f;

            return result;
        }

    } // namespace optimizer
} // namespace allocation
