#pragma once
/**
 * @file manager_config.hpp
 * @brief ModuleManager settings, parsed from a JSON object.
 *
 * JSON format (every field optional):
 * @code{.json}
 * {
 *   "exception_path":   "/var/log/app/exceptions.log",
 *   "log_level":        "info",
 *   "log_file":         "/var/log/app/app.log",
 *   "poll_interval_ms": 50,
 *   "handle_signals":   true,
 *   "admission": { "initial_delay_ms": 1, "max_delay_ms": 1000 }
 * }
 * @endcode
 */
#include "asyncmodules_export.h"
#include "core/task_dispatcher.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace asyncmodules::core
{

struct ASYNCMODULES_EXPORT ManagerConfig
{
    /// Failure reports are appended here when set.
    std::optional<std::filesystem::path> exception_path;

    /// One of trace, debug, info, warning, error, critical.
    std::string log_level{"info"};

    /// Empty: log to the console.
    std::string log_file;

    AdmissionPolicy admission;

    std::chrono::milliseconds poll_interval{50};

    /// Install SIGINT/SIGTERM handlers for the duration of run().
    bool handle_signals{true};

    /**
     * @brief Parses @p j. @p origin names the source in error messages.
     * @throws std::runtime_error prefixed "Manager config:" on invalid input.
     */
    static ManagerConfig from_json(const nlohmann::json &j, const std::string &origin = "<json>");
};

/**
 * @brief Applies `log_level` and `log_file` to the running Logger.
 * @return false if the logger is not running or the log file could not be opened.
 */
ASYNCMODULES_EXPORT bool apply_logging_config(const ManagerConfig &cfg);

} // namespace asyncmodules::core

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
