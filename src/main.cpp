/**
 * @file main.cpp
 * @brief Main entry point for the allocation advisor
 *
 * Command-line application that loads configuration and source data,
 * resolves a risk profile, runs the allocation pipeline and reports the
 * portfolio with its historical replay.
 */

#include "core/errors.hpp"
#include "data/data_loader.hpp"
#include "pipeline/allocation_pipeline.hpp"
#include "pipeline/pipeline_config.hpp"
#include "pipeline/statistics_cache.hpp"
#include <chrono>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace advisor;

namespace
{
    constexpr int kExitSuccess = 0;
    constexpr int kExitError = 1;
    constexpr int kExitInconsistent = 2;
}

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Allocation Advisor v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --kyc PATH            KYC answers JSON file (six scores, 0-100)\n"
              << "  --risk-level N        Pre-resolved risk level 1-10 (instead of --kyc)\n"
              << "  --amount X            Investment amount in base currency (required)\n"
              << "  --horizon YEARS       Investment horizon in years (required)\n"
              << "  --universe A,B,C      Asset ids to allocate over (default: all)\n"
              << "  --output PATH         Write the result as JSON\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExit codes: 0 success, 1 error, 2 inconsistent KYC responses\n"
              << "\nExample:\n"
              << "  " << program_name << " --config sample/config.json --risk-level 5 --amount 100000 --horizon 10\n"
              << "  " << program_name << " --config sample/config.json --kyc kyc.json --amount 250000 --horizon 3\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Allocation Advisor v1.0.0                                \n"
              << "       Risk-profiled mean-variance allocation                   \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string kyc_path;
    std::string output_path;
    std::string universe;
    std::string risk_level;
    std::string amount;
    std::string horizon;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--kyc" && i + 1 < argc)
            {
                args.kyc_path = argv[++i];
            }
            else if (arg == "--risk-level" && i + 1 < argc)
            {
                args.risk_level = argv[++i];
            }
            else if (arg == "--amount" && i + 1 < argc)
            {
                args.amount = argv[++i];
            }
            else if (arg == "--horizon" && i + 1 < argc)
            {
                args.horizon = argv[++i];
            }
            else if (arg == "--universe" && i + 1 < argc)
            {
                args.universe = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_path = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty() && !amount.empty() && !horizon.empty() &&
               (kyc_path.empty() != risk_level.empty());
    }
};

/**
 * @brief Parse a numeric option, naming the option on failure
 */
double parse_number(const std::string &option, const std::string &text)
{
    std::istringstream in(text);
    double value = 0.0;
    if (!(in >> value) || !in.eof())
    {
        throw ValidationError("Option " + option + " expects a number, got '" + text + "'");
    }
    return value;
}

std::vector<std::string> split_ids(const std::string &text)
{
    std::vector<std::string> ids;
    std::istringstream in(text);
    std::string id;
    while (std::getline(in, id, ','))
    {
        if (!id.empty())
        {
            ids.push_back(id);
        }
    }
    return ids;
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/6] Loading configuration..." << std::endl;

        pipeline::PipelineConfig config = pipeline::load_pipeline_config(args.config_path);
        if (args.verbose)
        {
            config.data_config.normalizer.verbose = true;
            config.optimizer_config.verbose = true;
            std::cout << "  - Data directory: " << config.data_config.data_dir << "\n";
            std::cout << "  - Base currency: " << config.data_config.base_currency << "\n";
            std::cout << "  - Assets configured: " << config.data_config.assets.size() << "\n";
        }

        pipeline::AllocationRequest request;
        request.amount = parse_number("--amount", args.amount);
        request.horizon_years = parse_number("--horizon", args.horizon);
        request.universe = split_ids(args.universe);
        if (!args.kyc_path.empty())
        {
            request.kyc = profile::KycResponse::from_json(data::DataLoader::load_json(args.kyc_path));
        }
        else
        {
            const double level = parse_number("--risk-level", args.risk_level);
            if (level != static_cast<double>(static_cast<int>(level)))
            {
                throw ValidationError("Option --risk-level expects an integer 1-10");
            }
            request.risk_level = static_cast<int>(level);
        }
        request.validate();

        // ====================================================================
        // 2. Load Source Data
        // ====================================================================
        std::cout << "[2/6] Loading source data..." << std::endl;

        data::DataContextPtr context = data::DataLoader::load_context(config.data_config);
        std::cout << "  - Loaded " << context->assets().size() << " assets, "
                  << context->fx_rates().size() << " FX series, "
                  << context->risk_free().size() << " risk-free observations" << std::endl;

        auto cache = std::make_shared<pipeline::StatisticsCache>();
        if (!config.cache_path.empty())
        {
            const size_t loaded = cache->load(config.cache_path, context->fingerprint());
            if (args.verbose)
            {
                std::cout << "  - Statistics cache entries loaded: " << loaded << "\n";
            }
        }

        pipeline::AllocationPipeline allocation(context, config, cache);

        // ====================================================================
        // 3. Resolve Risk Profile
        // ====================================================================
        std::cout << "[3/6] Resolving risk profile..." << std::endl;

        profile::RiskProfile risk_profile = allocation.resolve_profile(request);
        risk_profile.print_summary();

        // ====================================================================
        // 4. Allocate
        // ====================================================================
        std::cout << "[4/6] Normalizing series and optimizing allocation..." << std::endl;

        pipeline::AllocationResult result = allocation.run(request);

        // ====================================================================
        // 5. Report
        // ====================================================================
        std::cout << "[5/6] Reporting..." << std::endl;

        if (result.ok())
        {
            if (args.verbose && result.optimization)
            {
                result.optimization->print_summary();
            }
            if (result.history)
            {
                result.history->print_summary();
            }
        }
        result.print_summary();

        // ====================================================================
        // 6. Save
        // ====================================================================
        std::cout << "[6/6] Saving results..." << std::endl;

        if (!args.output_path.empty())
        {
            std::ofstream out(args.output_path);
            if (!out.is_open())
            {
                throw std::runtime_error("Could not open output file: " + args.output_path);
            }
            out << result.to_json().dump(2) << "\n";
            std::cout << "  - Result written to: " << args.output_path << "\n";
        }
        if (!config.cache_path.empty() && cache->size() > 0)
        {
            cache->save(config.cache_path, context->fingerprint());
            if (args.verbose)
            {
                std::cout << "  - Statistics cache saved to: " << config.cache_path << "\n";
            }
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        if (result.ok())
        {
            std::cout << "Allocation completed successfully in " << duration << " ms\n";
        }
        else
        {
            std::cout << "No allocation: KYC responses are inconsistent (" << duration << " ms)\n";
        }
        std::cout << "================================================================\n"
                  << std::endl;

        return result.ok() ? kExitSuccess : kExitInconsistent;
    }
    catch (const InfeasibleConstraintsError &e)
    {
        std::cerr << "\nInfeasible constraints: " << e.what() << std::endl;
        return kExitError;
    }
    catch (const SolverError &e)
    {
        std::cerr << "\nSolver error" << (e.retryable() ? " (retryable)" : "") << ": " << e.what() << std::endl;
        return kExitError;
    }
    catch (const DataError &e)
    {
        std::cerr << "\nData error: " << e.what() << std::endl;
        return kExitError;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return kExitError;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    // Parse command-line arguments
    auto args = CommandLineArgs::parse(argc, argv);

    // Show help if requested or invalid args
    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? kExitSuccess : kExitError;
    }

    print_banner();

    return run(args);
}
