/**
 * @file osqp_solver.cpp
 * @brief Implementation of OSQP solver wrapper
 */

#include "optimizer/osqp_solver.hpp"
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace allocation
{
    namespace optimizer
    {

        namespace
        {
            struct SettingsDeleter
            {
                void operator()(OSQPSettings *settings) const { std::free(settings); }
            };

            struct WorkspaceDeleter
            {
                void operator()(::OSQPSolver *work) const { osqp_cleanup(work); }
            };
        } // namespace

        OSQPSolver::OSQPSolver(const SolverOptions &options)
            : options_(options)
        {
        }

        void OSQPSolver::convert_to_csc(
            const Eigen::MatrixXd &dense,
            std::vector<OSQPFloat> &data,
            std::vector<OSQPInt> &indices,
            std::vector<OSQPInt> &indptr,
            bool upper_triangular_only)
        {
            const Eigen::Index rows = dense.rows();
            const Eigen::Index cols = dense.cols();

            data.clear();
            indices.clear();
            indptr.clear();
            indptr.reserve(static_cast<size_t>(cols + 1));
            indptr.push_back(0);

            for (Eigen::Index j = 0; j < cols; ++j)
            {
                const Eigen::Index row_limit = upper_triangular_only ? (j + 1) : rows;

                for (Eigen::Index i = 0; i < row_limit; ++i)
                {
                    const double val = dense(i, j);
                    if (std::abs(val) > 1e-14)
                    {
                        data.push_back(static_cast<OSQPFloat>(val));
                        indices.push_back(static_cast<OSQPInt>(i));
                    }
                }
                indptr.push_back(static_cast<OSQPInt>(data.size()));
            }
        }

        OSQPInt OSQPSolver::build_constraint_matrix(
            const QuadraticProblem &problem,
            std::vector<OSQPFloat> &A_data,
            std::vector<OSQPInt> &A_indices,
            std::vector<OSQPInt> &A_indptr,
            std::vector<OSQPFloat> &l,
            std::vector<OSQPFloat> &u)
        {
            const Eigen::Index n = problem.q.size();
            const Eigen::Index n_eq = problem.A_eq.rows();
            const Eigen::Index m = n_eq + n;

            A_data.clear();
            A_indices.clear();
            A_indptr.clear();
            l.assign(static_cast<size_t>(m), 0.0);
            u.assign(static_cast<size_t>(m), 0.0);

            A_indptr.push_back(0);

            for (Eigen::Index j = 0; j < n; ++j)
            {
                for (Eigen::Index i = 0; i < n_eq; ++i)
                {
                    const double val = problem.A_eq(i, j);
                    if (std::abs(val) > 1e-14)
                    {
                        A_data.push_back(static_cast<OSQPFloat>(val));
                        A_indices.push_back(static_cast<OSQPInt>(i));
                    }
                }

                // Box row for x_j: lb_j <= x_j <= ub_j
                A_data.push_back(1.0);
                A_indices.push_back(static_cast<OSQPInt>(n_eq + j));

                A_indptr.push_back(static_cast<OSQPInt>(A_data.size()));
            }

            for (Eigen::Index i = 0; i < n_eq; ++i)
            {
                l[static_cast<size_t>(i)] = problem.b_eq(i);
                u[static_cast<size_t>(i)] = problem.b_eq(i);
            }

            for (Eigen::Index i = 0; i < n; ++i)
            {
                l[static_cast<size_t>(n_eq + i)] = problem.lower_bounds(i);
                u[static_cast<size_t>(n_eq + i)] = problem.upper_bounds(i);
            }

            return static_cast<OSQPInt>(m);
        }

        SolverResult OSQPSolver::solve(const QuadraticProblem &problem) const
        {
            problem.validate();

            SolverResult result;
            const Eigen::Index n = problem.q.size();

            std::vector<OSQPFloat> P_data;
            std::vector<OSQPInt> P_indices;
            std::vector<OSQPInt> P_indptr;
            convert_to_csc(problem.P, P_data, P_indices, P_indptr, true);

            std::vector<OSQPFloat> q(static_cast<size_t>(n));
            for (Eigen::Index i = 0; i < n; ++i)
            {
                q[static_cast<size_t>(i)] = problem.q(i);
            }

            std::vector<OSQPFloat> A_data;
            std::vector<OSQPInt> A_indices;
            std::vector<OSQPInt> A_indptr;
            std::vector<OSQPFloat> l;
            std::vector<OSQPFloat> u;

            OSQPInt m = build_constraint_matrix(problem, A_data, A_indices, A_indptr, l, u);

            OSQPCscMatrix P_csc{};
            P_csc.m = static_cast<OSQPInt>(n);
            P_csc.n = static_cast<OSQPInt>(n);
            P_csc.p = P_indptr.data();
            P_csc.i = P_indices.data();
            P_csc.x = P_data.data();
            P_csc.nzmax = static_cast<OSQPInt>(P_data.size());
            P_csc.nz = -1; // -1 means CSC format (not triplet)

            OSQPCscMatrix A_csc{};
            A_csc.m = m;
            A_csc.n = static_cast<OSQPInt>(n);
            A_csc.p = A_indptr.data();
            A_csc.i = A_indices.data();
            A_csc.x = A_data.data();
            A_csc.nzmax = static_cast<OSQPInt>(A_data.size());
            A_csc.nz = -1;

            std::unique_ptr<OSQPSettings, SettingsDeleter> settings(
                static_cast<OSQPSettings *>(std::malloc(sizeof(OSQPSettings))));
            if (!settings)
            {
                throw std::runtime_error("Failed to allocate OSQP settings");
            }

            osqp_set_default_settings(settings.get());
            settings->verbose = options_.verbose ? 1 : 0;
            settings->eps_abs = options_.tolerance;
            settings->eps_rel = options_.tolerance;
            settings->max_iter = static_cast<OSQPInt>(options_.max_iterations);
            settings->polishing = 1;

            ::OSQPSolver *raw_work = nullptr;
            OSQPInt exit_flag = osqp_setup(&raw_work, &P_csc, q.data(), &A_csc,
                                           l.data(), u.data(), m, static_cast<OSQPInt>(n),
                                           settings.get());
            std::unique_ptr<::OSQPSolver, WorkspaceDeleter> work(raw_work);

            if (exit_flag != 0 || !work)
            {
                result.success = false;
                result.message = "OSQP setup failed (exit flag " + std::to_string(exit_flag) + ")";
                return result;
            }

            osqp_solve(work.get());

            result.solution = Eigen::VectorXd::Zero(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                result.solution(i) = work->solution->x[i];
            }

            result.iterations = static_cast<int>(work->info->iter);
            result.objective_value = work->info->obj_val;
            result.message = work->info->status;

            const OSQPInt status = work->info->status_val;
            result.success = (status == OSQP_SOLVED || status == OSQP_SOLVED_INACCURATE);

            if (!result.success && options_.verbose)
            {
                std::cerr << "Warning: OSQP did not converge: " << result.message << "\n";
            }

            return result;
        }

    } // namespace optimizer
} // namespace allocation
