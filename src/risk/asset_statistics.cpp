/**
 * @file asset_statistics.cpp
 * @brief Implementation of StatisticsEngine and AssetStatistics serialization
 */

#include "risk/asset_statistics.hpp"
#include "risk/sample_covariance.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <utility>

namespace advisor
{
    namespace risk
    {

        namespace
        {
            constexpr double kMinVolatility = 1e-10;

            nlohmann::json vector_to_json(const Eigen::VectorXd &v)
            {
                nlohmann::json arr = nlohmann::json::array();
                for (Eigen::Index i = 0; i < v.size(); ++i)
                {
                    arr.push_back(v(i));
                }
                return arr;
            }

            Eigen::VectorXd vector_from_json(const nlohmann::json &j, Eigen::Index expected, const char *name)
            {
                if (!j.is_array() || static_cast<Eigen::Index>(j.size()) != expected)
                {
                    throw DataError(std::string("Cached statistics field '") + name + "' has wrong size");
                }
                Eigen::VectorXd v(expected);
                for (Eigen::Index i = 0; i < expected; ++i)
                {
                    v(i) = j.at(static_cast<size_t>(i)).get<double>();
                }
                return v;
            }

            nlohmann::json matrix_to_json(const Eigen::MatrixXd &m)
            {
                nlohmann::json rows = nlohmann::json::array();
                for (Eigen::Index i = 0; i < m.rows(); ++i)
                {
                    rows.push_back(vector_to_json(m.row(i).transpose()));
                }
                return rows;
            }

            Eigen::MatrixXd matrix_from_json(const nlohmann::json &j, Eigen::Index n, const char *name)
            {
                if (!j.is_array() || static_cast<Eigen::Index>(j.size()) != n)
                {
                    throw DataError(std::string("Cached statistics field '") + name + "' has wrong size");
                }
                Eigen::MatrixXd m(n, n);
                for (Eigen::Index i = 0; i < n; ++i)
                {
                    m.row(i) = vector_from_json(j.at(static_cast<size_t>(i)), n, name).transpose();
                }
                return m;
            }
        } // namespace

        // ===================================================================
        // AssetStatistics
        // ===================================================================

        std::vector<std::string> AssetStatistics::tickers() const
        {
            std::vector<std::string> ids;
            ids.reserve(assets.size());
            for (const auto &a : assets)
            {
                ids.push_back(a.id);
            }
            return ids;
        }

        int AssetStatistics::find_asset(const std::string &id) const
        {
            for (size_t i = 0; i < assets.size(); ++i)
            {
                if (assets[i].id == id)
                {
                    return static_cast<int>(i);
                }
            }
            return -1;
        }

        nlohmann::json AssetStatistics::to_json() const
        {
            nlohmann::json j;
            nlohmann::json list = nlohmann::json::array();
            for (const auto &a : assets)
            {
                nlohmann::json entry;
                entry["id"] = a.id;
                entry["asset_class"] = a.asset_class;
                entry["currency"] = a.currency;
                entry["annual_return"] = a.annual_return;
                entry["annual_volatility"] = a.annual_volatility;
                if (a.sharpe_ratio)
                {
                    entry["sharpe_ratio"] = *a.sharpe_ratio;
                }
                else
                {
                    entry["sharpe_ratio"] = nullptr;
                }
                list.push_back(entry);
            }
            j["assets"] = list;
            j["covariance"] = matrix_to_json(covariance);
            j["mean_risk_free"] = mean_risk_free;
            j["observations"] = observations;
            j["window_start"] = window_start.to_string();
            j["window_end"] = window_end.to_string();
            j["base_currency"] = base_currency;
            j["return_type"] = data::to_string(return_type);
            j["warnings"] = warnings;
            return j;
        }

        AssetStatistics AssetStatistics::from_json(const nlohmann::json &j)
        {
            for (const char *key : {"assets", "covariance", "window_start", "window_end"})
            {
                if (!j.contains(key))
                {
                    throw DataError(std::string("Cached statistics missing field '") + key + "'");
                }
            }

            AssetStatistics stats;
            for (const auto &entry : j.at("assets"))
            {
                AssetStats a;
                a.id = entry.at("id").get<std::string>();
                a.asset_class = entry.value("asset_class", "unknown");
                a.currency = entry.value("currency", "");
                a.annual_return = entry.at("annual_return").get<double>();
                a.annual_volatility = entry.at("annual_volatility").get<double>();
                if (entry.contains("sharpe_ratio") && !entry.at("sharpe_ratio").is_null())
                {
                    a.sharpe_ratio = entry.at("sharpe_ratio").get<double>();
                }
                stats.assets.push_back(a);
            }

            const Eigen::Index n = static_cast<Eigen::Index>(stats.assets.size());
            if (n == 0)
            {
                throw DataError("Cached statistics contain no assets");
            }
            stats.expected_returns.resize(n);
            stats.volatilities.resize(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                stats.expected_returns(i) = stats.assets[static_cast<size_t>(i)].annual_return;
                stats.volatilities(i) = stats.assets[static_cast<size_t>(i)].annual_volatility;
            }
            stats.covariance = matrix_from_json(j.at("covariance"), n, "covariance");
            stats.correlation = RiskModel::covariance_to_correlation(stats.covariance);
            stats.mean_risk_free = j.value("mean_risk_free", 0.0);
            stats.observations = j.value("observations", static_cast<size_t>(0));
            stats.window_start = data::Date::parse(j.at("window_start").get<std::string>());
            stats.window_end = data::Date::parse(j.at("window_end").get<std::string>());
            stats.base_currency = j.value("base_currency", "");
            stats.return_type = data::parse_return_type(j.value("return_type", "simple"));
            stats.warnings = j.value("warnings", std::vector<std::string>{});

            const DefinitenessCheck check = RiskModel::check_definiteness(
                stats.covariance, 1e-10 * std::max(1.0, stats.covariance.diagonal().maxCoeff()));
            stats.positive_semidefinite = check.positive_semidefinite;
            stats.min_eigenvalue = check.min_eigenvalue;
            return stats;
        }

        void AssetStatistics::print_summary() const
        {
            std::cout << "\n=== Asset Statistics ===\n";
            std::cout << "Window: " << window_start.to_string() << " to " << window_end.to_string()
                      << " (" << observations << " months, " << base_currency << ")\n";
            std::cout << "Mean risk-free: " << std::fixed << std::setprecision(2)
                      << mean_risk_free * 100 << "%\n";
            std::cout << std::string(60, '-') << "\n";
            std::cout << std::left << std::setw(16) << "Asset" << std::setw(12) << "Class"
                      << std::right << std::setw(10) << "Return" << std::setw(10) << "Vol"
                      << std::setw(10) << "Sharpe" << "\n";
            for (const auto &a : assets)
            {
                std::cout << std::left << std::setw(16) << a.id << std::setw(12) << a.asset_class
                          << std::right << std::setw(9) << std::setprecision(2) << a.annual_return * 100 << "%"
                          << std::setw(9) << a.annual_volatility * 100 << "%";
                if (a.sharpe_ratio)
                {
                    std::cout << std::setw(10) << std::setprecision(3) << *a.sharpe_ratio;
                }
                else
                {
                    std::cout << std::setw(10) << "n/a";
                }
                std::cout << "\n";
            }
            std::cout << "PSD: " << (positive_semidefinite ? "yes" : "NO")
                      << "  (min eigenvalue " << std::scientific << std::setprecision(3)
                      << min_eigenvalue << std::defaultfloat << ")\n";
            std::cout << "========================\n"
                      << std::endl;
        }

        // ===================================================================
        // StatisticsEngine
        // ===================================================================

        StatisticsEngine::StatisticsEngine(std::shared_ptr<const RiskModel> model, int periods_per_year)
            : model_(model ? std::move(model)
                           : std::shared_ptr<const RiskModel>(std::make_shared<const SampleCovariance>(true))),
              periods_per_year_(periods_per_year)
        {
            if (periods_per_year_ <= 0)
            {
                throw ValidationError("periods_per_year must be positive, got: " +
                                      std::to_string(periods_per_year_));
            }
        }

        AssetStatistics StatisticsEngine::compute(const data::NormalizedUniverse &universe,
                                                  const std::map<std::string, std::string> &asset_classes,
                                                  const std::map<std::string, std::string> &currencies) const
        {
            const Eigen::Index t = universe.returns.rows();
            const Eigen::Index n = universe.returns.cols();

            if (n == 0 || static_cast<size_t>(n) != universe.tickers.size())
            {
                throw DataError("Normalized universe has no assets or inconsistent dimensions");
            }
            if (t < 2 || static_cast<size_t>(t) != universe.dates.size())
            {
                throw DataError("Normalized universe needs at least 2 aligned periods, got " + std::to_string(t));
            }

            const double ppy = static_cast<double>(periods_per_year_);

            AssetStatistics stats;
            stats.observations = static_cast<size_t>(t);
            stats.window_start = universe.dates.front();
            stats.window_end = universe.dates.back();
            stats.base_currency = universe.base_currency;
            stats.return_type = universe.return_type;
            stats.mean_risk_free = universe.risk_free_annual.size() > 0 ? universe.risk_free_annual.mean() : 0.0;

            const Eigen::MatrixXd monthly_cov = model_->estimate_covariance(universe.returns);
            stats.covariance = RiskModel::ensure_symmetric(monthly_cov * ppy);
            stats.expected_returns = universe.returns.colwise().mean().transpose() * ppy;
            stats.volatilities = stats.covariance.diagonal().cwiseMax(0.0).array().sqrt();
            stats.correlation = RiskModel::covariance_to_correlation(stats.covariance);

            for (Eigen::Index i = 0; i < n; ++i)
            {
                AssetStats a;
                a.id = universe.tickers[static_cast<size_t>(i)];
                auto it = asset_classes.find(a.id);
                a.asset_class = (it != asset_classes.end()) ? it->second : "unknown";
                auto ccy = currencies.find(a.id);
                a.currency = (ccy != currencies.end()) ? ccy->second : universe.base_currency;
                a.annual_return = stats.expected_returns(i);
                a.annual_volatility = stats.volatilities(i);
                if (a.annual_volatility < kMinVolatility)
                {
                    const std::string msg = "Sharpe ratio undefined for " + a.id + " (zero volatility)";
                    std::cerr << "Warning: " << msg << "\n";
                    stats.warnings.push_back(msg);
                }
                else
                {
                    a.sharpe_ratio = (a.annual_return - stats.mean_risk_free) / a.annual_volatility;
                }
                stats.assets.push_back(a);
            }

            if (t <= n)
            {
                const std::string msg = "Only " + std::to_string(t) + " observations for " + std::to_string(n) +
                                        " assets; covariance matrix is singular";
                std::cerr << "Warning: " << msg << "\n";
                stats.warnings.push_back(msg);
            }

            const DefinitenessCheck check = RiskModel::check_definiteness(
                stats.covariance, 1e-10 * std::max(1.0, stats.covariance.diagonal().maxCoeff()));
            stats.positive_semidefinite = check.positive_semidefinite;
            stats.min_eigenvalue = check.min_eigenvalue;

            return stats;
        }

    } // namespace risk
} // namespace advisor
