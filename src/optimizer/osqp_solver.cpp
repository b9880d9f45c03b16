/**
 * @file osqp_solver.cpp
 * @brief Implementation of OSQP solver wrapper
 */

#include "optimizer/osqp_solver.hpp"
#include <cmath>
#include <memory>

namespace advisor
{
    namespace optimizer
    {

        namespace
        {
            constexpr double kSparsityCutoff = 1e-14;

            struct OSQPWorkspaceDeleter
            {
                void operator()(::OSQPSolver *work) const
                {
                    if (work != nullptr)
                    {
                        osqp_cleanup(work);
                    }
                }
            };

            using OSQPWorkspacePtr = std::unique_ptr<::OSQPSolver, OSQPWorkspaceDeleter>;
        } // namespace

        SolverStatus OSQPSolver::map_status(OSQPInt status_val)
        {
            switch (status_val)
            {
            case OSQP_SOLVED:
                return SolverStatus::SOLVED;
            case OSQP_SOLVED_INACCURATE:
                return SolverStatus::SOLVED_INACCURATE;
            case OSQP_PRIMAL_INFEASIBLE:
            case OSQP_PRIMAL_INFEASIBLE_INACCURATE:
                return SolverStatus::PRIMAL_INFEASIBLE;
            case OSQP_DUAL_INFEASIBLE:
            case OSQP_DUAL_INFEASIBLE_INACCURATE:
                return SolverStatus::DUAL_INFEASIBLE;
            case OSQP_MAX_ITER_REACHED:
                return SolverStatus::MAX_ITERATIONS;
            case OSQP_TIME_LIMIT_REACHED:
                return SolverStatus::TIME_LIMIT;
            case OSQP_NON_CVX:
                return SolverStatus::NON_CONVEX;
            default:
                return SolverStatus::UNKNOWN;
            }
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
            indptr.reserve(static_cast<size_t>(cols) + 1);

            indptr.push_back(0);

            for (Eigen::Index j = 0; j < cols; ++j)
            {
                const Eigen::Index row_limit = upper_triangular_only ? (j + 1) : rows;

                for (Eigen::Index i = 0; i < row_limit; ++i)
                {
                    const double val = dense(i, j);
                    // Keep the diagonal even when zero so P always has a full pattern there
                    if (std::abs(val) > kSparsityCutoff || (upper_triangular_only && i == j))
                    {
                        data.push_back(val);
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
            const Eigen::Index n_ineq = problem.A_ineq.rows();

            // n_eq equality rows + n_ineq inequality rows + n bound rows (l <= x <= u in one row each)
            const Eigen::Index m = n_eq + n_ineq + n;

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
                    if (std::abs(val) > kSparsityCutoff)
                    {
                        A_data.push_back(val);
                        A_indices.push_back(static_cast<OSQPInt>(i));
                    }
                }

                for (Eigen::Index i = 0; i < n_ineq; ++i)
                {
                    const double val = problem.A_ineq(i, j);
                    if (std::abs(val) > kSparsityCutoff)
                    {
                        A_data.push_back(val);
                        A_indices.push_back(static_cast<OSQPInt>(n_eq + i));
                    }
                }

                A_data.push_back(1.0);
                A_indices.push_back(static_cast<OSQPInt>(n_eq + n_ineq + j));

                A_indptr.push_back(static_cast<OSQPInt>(A_data.size()));
            }

            for (Eigen::Index i = 0; i < n_eq; ++i)
            {
                l[static_cast<size_t>(i)] = problem.b_eq(i);
                u[static_cast<size_t>(i)] = problem.b_eq(i);
            }

            for (Eigen::Index i = 0; i < n_ineq; ++i)
            {
                const size_t row = static_cast<size_t>(n_eq + i);
                l[row] = std::isfinite(problem.b_ineq_lower(i)) ? problem.b_ineq_lower(i) : -OSQP_INFTY;
                u[row] = std::isfinite(problem.b_ineq_upper(i)) ? problem.b_ineq_upper(i) : OSQP_INFTY;
            }

            for (Eigen::Index i = 0; i < n; ++i)
            {
                const size_t row = static_cast<size_t>(n_eq + n_ineq + i);
                l[row] = std::isfinite(problem.lower_bounds(i)) ? problem.lower_bounds(i) : -OSQP_INFTY;
                u[row] = std::isfinite(problem.upper_bounds(i)) ? problem.upper_bounds(i) : OSQP_INFTY;
            }

            return static_cast<OSQPInt>(m);
        }

        SolverResult OSQPSolver::solve(const QuadraticProblem &problem, const SolverOptions &options) const
        {
            problem.validate();

            SolverResult result;
            const OSQPInt n = static_cast<OSQPInt>(problem.q.size());

            // OSQP takes the upper triangle of P
            std::vector<OSQPFloat> P_data;
            std::vector<OSQPInt> P_indices;
            std::vector<OSQPInt> P_indptr;
            convert_to_csc(problem.P, P_data, P_indices, P_indptr, true);

            std::vector<OSQPFloat> q(problem.q.data(), problem.q.data() + problem.q.size());

            std::vector<OSQPFloat> A_data;
            std::vector<OSQPInt> A_indices;
            std::vector<OSQPInt> A_indptr;
            std::vector<OSQPFloat> l;
            std::vector<OSQPFloat> u;
            const OSQPInt m = build_constraint_matrix(problem, A_data, A_indices, A_indptr, l, u);

            OSQPCscMatrix P_csc{};
            P_csc.m = n;
            P_csc.n = n;
            P_csc.p = P_indptr.data();
            P_csc.i = P_indices.data();
            P_csc.x = P_data.data();
            P_csc.nzmax = static_cast<OSQPInt>(P_data.size());
            P_csc.nz = -1; // -1 means CSC format (not triplet)

            OSQPCscMatrix A_csc{};
            A_csc.m = m;
            A_csc.n = n;
            A_csc.p = A_indptr.data();
            A_csc.i = A_indices.data();
            A_csc.x = A_data.data();
            A_csc.nzmax = static_cast<OSQPInt>(A_data.size());
            A_csc.nz = -1;

            OSQPSettings settings;
            osqp_set_default_settings(&settings);
            settings.verbose = options.verbose ? 1 : 0;
            settings.eps_abs = options.tolerance;
            settings.eps_rel = options.tolerance;
            settings.max_iter = options.max_iterations;
            settings.polishing = options.polish ? 1 : 0;
            settings.time_limit = options.time_limit_seconds > 0.0 ? options.time_limit_seconds : 0.0;

            // :: disambiguates the C workspace type from this class
            ::OSQPSolver *raw_work = nullptr;
            const OSQPInt exit_flag = osqp_setup(&raw_work, &P_csc, q.data(), &A_csc,
                                                 l.data(), u.data(), m, n, &settings);
            OSQPWorkspacePtr work(raw_work);

            if (exit_flag != 0 || !work)
            {
                result.success = false;
                result.status = SolverStatus::SETUP_FAILED;
                result.message = "OSQP setup failed (code " + std::to_string(exit_flag) + ")";
                return result;
            }

            osqp_solve(work.get());

            const OSQPInfo *info = work->info;
            result.status = map_status(info->status_val);
            result.message = info->status;
            result.iterations = static_cast<int>(info->iter);
            result.objective_value = info->obj_val;
            result.solve_time_seconds = info->run_time;

            if (result.status == SolverStatus::SOLVED || result.status == SolverStatus::SOLVED_INACCURATE)
            {
                result.solution = Eigen::Map<const Eigen::VectorXd>(work->solution->x, problem.q.size());
                result.success = result.solution.allFinite();
            }
            else
            {
                result.success = false;
            }

            return result;
        }

    } // namespace optimizer
} // namespace advisor
