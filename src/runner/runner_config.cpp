/**
 * @file runner_config.cpp
 * @brief RunnerConfig JSON parsing.
 */
#include "runner_config.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace asyncmodules::runner
{

namespace
{

ModuleSpec parse_module(const nlohmann::json &m, size_t index, const std::string &origin)
{
    const std::string where = "modules[" + std::to_string(index) + "]";
    if (!m.is_object())
        throw std::runtime_error("Runner config: " + where + " must be a JSON object in '" +
                                 origin + "'");
    if (!m.contains("name") || !m["name"].is_string() || m["name"].get<std::string>().empty())
        throw std::runtime_error("Runner config: " + where +
                                 " is missing a non-empty string 'name' in '" + origin + "'");
    if (!m.contains("type") || !m["type"].is_string())
        throw std::runtime_error("Runner config: " + where + " is missing string 'type' in '" +
                                 origin + "'");

    ModuleSpec spec;
    spec.name = m["name"].get<std::string>();
    spec.type = m["type"].get<std::string>();
    for (const auto &[key, value] : m.items())
    {
        if (key != "name" && key != "type")
            spec.options[key] = value;
    }
    return spec;
}

} // anonymous namespace

RunnerConfig RunnerConfig::from_json(const nlohmann::json &j, const std::string &origin)
{
    if (!j.is_object())
        throw std::runtime_error("Runner config: top level must be a JSON object in '" + origin +
                                 "'");

    RunnerConfig cfg;
    if (j.contains("manager"))
        cfg.manager = core::ManagerConfig::from_json(j["manager"], origin);

    if (!j.contains("modules") || !j["modules"].is_array())
        throw std::runtime_error("Runner config: 'modules' must be an array in '" + origin + "'");

    std::unordered_set<std::string> seen;
    size_t index = 0;
    for (const auto &m : j["modules"])
    {
        ModuleSpec spec = parse_module(m, index++, origin);
        if (!seen.insert(spec.name).second)
        {
            // Registration would silently replace the earlier entry.
            std::fprintf(stderr, "[runner] WARN: module '%s' is listed more than once in '%s'; "
                                 "the last entry wins\n",
                         spec.name.c_str(), origin.c_str());
        }
        cfg.modules.push_back(std::move(spec));
    }
    return cfg;
}

RunnerConfig RunnerConfig::from_json_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Runner config: cannot open file: " + path);

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error("Runner config: JSON parse error in '" + path + "': " + e.what());
    }
    return from_json(j, path);
}

} // namespace asyncmodules::runner
