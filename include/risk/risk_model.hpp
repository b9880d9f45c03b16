/**
 * @file risk_model.hpp
 * @brief Abstract interface for covariance estimation on monthly returns
 *
 * Estimators work on per-period returns and report per-period covariance.
 * Annualization is the caller's concern (the statistics engine scales by
 * the number of periods per year).
 *
 * Thread Safety: Implementations are expected to be thread-safe for
 * read-only operations.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace advisor
{
    namespace risk
    {

        /**
         * @struct DefinitenessCheck
         * @brief Outcome of an eigenvalue positive-semidefiniteness test
         */
        struct DefinitenessCheck
        {
            bool positive_semidefinite = false;
            double min_eigenvalue = 0.0;
        };

        /**
         * @class RiskModel
         * @brief Abstract base class for covariance estimation
         *
         * Usage Example:
         * @code
         * std::unique_ptr<RiskModel> model = std::make_unique<SampleCovariance>(true);
         * Eigen::MatrixXd monthly_cov = model->estimate_covariance(returns);
         * @endcode
         */
        class RiskModel
        {
        public:
            virtual ~RiskModel() = default;

            /**
             * @brief Estimate covariance matrix from return data
             * @param returns Matrix of returns (rows = observations, cols = assets)
             * @return Covariance matrix (n_assets x n_assets), exactly symmetric
             * @throws DataError if returns is empty, too short, or not finite
             */
            virtual Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const = 0;

            /**
             * @brief Estimate correlation matrix from return data
             *
             * Default implementation: convert the estimated covariance.
             */
            virtual Eigen::MatrixXd estimate_correlation(
                const Eigen::MatrixXd &returns) const;

            virtual std::string get_name() const = 0;

            /**
             * @brief Convert covariance matrix to correlation matrix
             *
             * Assets with zero variance get zero correlation with everything
             * but themselves.
             */
            static Eigen::MatrixXd covariance_to_correlation(
                const Eigen::MatrixXd &covariance);

            /**
             * @brief Eigenvalue test for positive semidefiniteness
             * @param matrix Symmetric matrix
             * @param tolerance Eigenvalues above -tolerance count as non-negative
             */
            static DefinitenessCheck check_definiteness(const Eigen::MatrixXd &matrix,
                                                        double tolerance = 1e-10);

            /// Enforce exact symmetry: (M + M^T) / 2
            static Eigen::MatrixXd ensure_symmetric(const Eigen::MatrixXd &matrix);

        protected:
            /**
             * @brief Validate input returns matrix
             * @throws DataError if validation fails
             */
            static void validate_returns(const Eigen::MatrixXd &returns);
        };

    } // namespace risk
} // namespace advisor
