#pragma once
/**
 * @file runner_config.hpp
 * @brief Configuration of the asyncmodules-runner host.
 *
 * JSON format:
 * @code{.json}
 * {
 *   "manager": { "log_level": "info", "exception_path": "exceptions.log" },
 *   "modules": [
 *     { "name": "clock",   "type": "ticker",  "interval_ms": 500, "exit_after": 10 },
 *     { "name": "journal", "type": "journal" },
 *     { "name": "faulty",  "type": "faulty",  "fail_every": 3 }
 *   ]
 * }
 * @endcode
 *
 * Each module entry needs `name` and `type`; every other key is passed to the module
 * as its options.
 */
#include "amod_core.hpp"

#include <string>
#include <vector>

namespace asyncmodules::runner
{

struct ModuleSpec
{
    std::string name;
    std::string type;
    nlohmann::json options = nlohmann::json::object();
};

struct RunnerConfig
{
    core::ManagerConfig manager;
    std::vector<ModuleSpec> modules;

    /**
     * @throws std::runtime_error prefixed "Runner config:" (or "Manager config:" for
     *         the manager block) on unreadable or invalid input.
     */
    static RunnerConfig from_json_file(const std::string &path);
    static RunnerConfig from_json(const nlohmann::json &j, const std::string &origin);
};

} // namespace asyncmodules::runner
