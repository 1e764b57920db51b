/**
 * @file runner_main.cpp
 * @brief asyncmodules-runner: hosts the demo module catalogue under a ModuleManager.
 *
 * ## Usage
 *
 *     asyncmodules-runner --config <path.json>                    # Run until exit
 *     asyncmodules-runner --config <path.json> --log-level debug  # Override log level
 *     asyncmodules-runner --config <path.json> --list-modules     # Print modules; exit 0
 *
 * The first SIGINT/SIGTERM requests an orderly shutdown (`on_exit`), the second
 * forces the loop to stop, the third terminates the process immediately.
 *
 * Exit status: 0 after an orderly shutdown, 1 on configuration errors, 2 if the run
 * was forced.
 */
#include "demo_modules.hpp"
#include "runner_config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace asyncmodules;

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

namespace
{

struct RunnerArgs
{
    std::string config_path;
    std::string log_level;
    bool list_modules{false};
};

void print_usage(const char *prog)
{
    std::cout << "Usage:\n"
              << "  " << prog << " --config <path.json> [--log-level <level>] [--list-modules]\n\n"
              << "Options:\n"
              << "  --config <path>     Path to runner JSON config (required)\n"
              << "  --log-level <lvl>   trace|debug|info|warning|error|critical (overrides config)\n"
              << "  --list-modules      Print configured modules and known types; exit 0\n"
              << "  --help              Show this message\n";
}

RunnerArgs parse_args(int argc, char *argv[])
{
    RunnerArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--config" && i + 1 < argc)
        {
            args.config_path = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc)
        {
            args.log_level = argv[++i];
        }
        else if (arg == "--list-modules")
        {
            args.list_modules = true;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    if (args.config_path.empty())
    {
        std::cerr << "Error: --config <path> is required\n\n";
        print_usage(argv[0]);
        std::exit(1);
    }
    return args;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    const RunnerArgs args = parse_args(argc, argv);

    // ── Load config ───────────────────────────────────────────────────────────
    runner::RunnerConfig config;
    try
    {
        config = runner::RunnerConfig::from_json_file(args.config_path);
        if (!args.log_level.empty())
        {
            if (!utils::Logger::level_from_string(args.log_level))
                throw std::runtime_error("invalid --log-level '" + args.log_level + "'");
            config.manager.log_level = args.log_level;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    // ── list-modules mode ─────────────────────────────────────────────────────
    if (args.list_modules)
    {
        std::cout << "Configured modules (" << config.modules.size() << "):\n";
        for (const auto &spec : config.modules)
        {
            std::cout << "  " << spec.name << "  [" << spec.type << "]";
            if (!spec.options.empty())
                std::cout << "  " << spec.options.dump();
            std::cout << "\n";
        }
        std::cout << "Known types:";
        for (const auto &type : runner::demo_module_types())
            std::cout << " " << type;
        std::cout << "\n";
        return 0;
    }

    // ── Logger ────────────────────────────────────────────────────────────────
    utils::LoggerGuard logger_guard;
    if (!core::apply_logging_config(config.manager))
    {
        std::cerr << "Warning: could not apply logging config; logging to the console\n";
    }
    LOGGER_INFO("asyncmodules-runner {} starting ({} modules)", platform::get_version_string(),
                config.modules.size());

    // ── Manager ───────────────────────────────────────────────────────────────
    core::ModuleManager manager(config.manager);
    try
    {
        runner::register_modules(manager, config.modules);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Module registration failed: {}", e.what());
        return 1;
    }

    try
    {
        manager.run();
    }
    catch (const std::exception &e)
    {
        LOGGER_CRITICAL("Module manager terminated with an exception: {}", e.what());
        return 1;
    }

    LOGGER_INFO("asyncmodules-runner finished{}", manager.was_forced() ? " (forced)" : "");
    return manager.was_forced() ? 2 : 0;
}
