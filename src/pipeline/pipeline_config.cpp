/**
 * @file pipeline_config.cpp
 * @brief Implementation of pipeline configuration loading
 */

#include "pipeline/pipeline_config.hpp"
#include "core/errors.hpp"
#include <filesystem>

namespace advisor
{
    namespace pipeline
    {

        namespace
        {
            std::string resolve_against(const std::filesystem::path &base, const std::string &path)
            {
                if (path.empty())
                {
                    return base.string();
                }
                const std::filesystem::path p(path);
                return p.is_absolute() ? p.string() : (base / p).string();
            }
        } // namespace

        PipelineConfig PipelineConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object() || !j.contains("data"))
            {
                throw ValidationError("Pipeline configuration requires a 'data' section");
            }

            PipelineConfig config;
            config.data_config = data::DataConfig::from_json(j.at("data"));

            if (j.contains("optimizer"))
            {
                config.optimizer_config = optimizer::OptimizerConfig::from_json(j.at("optimizer"));
            }
            if (j.contains("profiler"))
            {
                config.profiler_config = profile::ProfilerConfig::from_json(j.at("profiler"));
            }
            if (j.contains("backtest"))
            {
                config.backtest_config = backtest::BacktestConfig::from_json(j.at("backtest"));
            }
            if (j.contains("cache"))
            {
                config.cache_path = j.at("cache").value("path", "");
            }

            return config;
        }

        PipelineConfig load_pipeline_config(const std::string &path)
        {
            PipelineConfig config = PipelineConfig::from_json(data::DataLoader::load_json(path));

            const std::filesystem::path base = std::filesystem::path(path).parent_path();
            if (!base.empty())
            {
                config.data_config.data_dir = resolve_against(base, config.data_config.data_dir);
                if (!config.cache_path.empty())
                {
                    config.cache_path = resolve_against(base, config.cache_path);
                }
            }

            return config;
        }

    } // namespace pipeline
} // namespace advisor
