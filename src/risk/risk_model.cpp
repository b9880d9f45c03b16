/**
 * @file risk_model.cpp
 * @brief Implementation of RiskModel base class utilities
 */

#include "risk/risk_model.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace advisor
{
    namespace risk
    {
        Eigen::MatrixXd RiskModel::estimate_correlation(const Eigen::MatrixXd &returns) const
        {
            return covariance_to_correlation(estimate_covariance(returns));
        }

        void RiskModel::validate_returns(const Eigen::MatrixXd &returns)
        {
            if (returns.rows() == 0 || returns.cols() == 0)
            {
                throw DataError("Returns matrix cannot be empty.");
            }

            if (returns.rows() < 2)
            {
                throw DataError("At least 2 observations are required for covariance estimation, received: " +
                                std::to_string(returns.rows()));
            }

            if (!returns.allFinite())
            {
                throw DataError("Returns matrix contains NaN or Inf values.");
            }
        }

        Eigen::MatrixXd RiskModel::covariance_to_correlation(const Eigen::MatrixXd &covariance)
        {
            const Eigen::Index n = covariance.rows();
            if (n == 0 || covariance.cols() != n)
            {
                throw DataError("Covariance matrix must be square and non-empty");
            }

            Eigen::VectorXd std_devs = covariance.diagonal().cwiseMax(0.0).array().sqrt();
            Eigen::MatrixXd correlation = Eigen::MatrixXd::Zero(n, n);

            for (Eigen::Index i = 0; i < n; ++i)
            {
                for (Eigen::Index j = 0; j < n; ++j)
                {
                    if (i == j)
                    {
                        correlation(i, j) = 1.0;
                        continue;
                    }
                    const double denom = std_devs(i) * std_devs(j);
                    if (denom <= 0.0)
                    {
                        continue; // zero-variance asset
                    }
                    // Clamp to [-1, 1] to absorb rounding
                    correlation(i, j) = std::max(-1.0, std::min(1.0, covariance(i, j) / denom));
                }
            }

            return correlation;
        }

        DefinitenessCheck RiskModel::check_definiteness(const Eigen::MatrixXd &matrix, double tolerance)
        {
            DefinitenessCheck check;
            if (matrix.rows() == 0 || matrix.rows() != matrix.cols())
            {
                return check;
            }
            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(matrix, Eigen::EigenvaluesOnly);
            if (solver.info() != Eigen::Success)
            {
                return check;
            }
            check.min_eigenvalue = solver.eigenvalues().minCoeff();
            check.positive_semidefinite = check.min_eigenvalue >= -tolerance;
            return check;
        }

        Eigen::MatrixXd RiskModel::ensure_symmetric(const Eigen::MatrixXd &matrix)
        {
            return 0.5 * (matrix + matrix.transpose());
        }
    } // namespace risk
} // namespace advisor
