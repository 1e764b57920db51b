#include "amod_core.hpp"

#include <stdexcept>

namespace asyncmodules::core
{

namespace
{

int64_t parse_positive_ms(const nlohmann::json &j, const std::string &key,
                          const std::string &origin)
{
    if (!j.is_number_integer())
        throw std::runtime_error("Manager config: '" + key + "' must be an integer in '" +
                                 origin + "'");
    const auto value = j.get<int64_t>();
    if (value <= 0)
        throw std::runtime_error("Manager config: '" + key + "' must be > 0 in '" + origin +
                                 "' (got " + std::to_string(value) + ")");
    return value;
}

} // anonymous namespace

ManagerConfig ManagerConfig::from_json(const nlohmann::json &j, const std::string &origin)
{
    if (!j.is_object())
        throw std::runtime_error("Manager config: expected a JSON object in '" + origin + "'");

    ManagerConfig cfg;

    if (j.contains("exception_path") && !j["exception_path"].is_null())
    {
        if (!j["exception_path"].is_string() || j["exception_path"].get<std::string>().empty())
            throw std::runtime_error("Manager config: 'exception_path' must be a non-empty "
                                     "string in '" +
                                     origin + "'");
        cfg.exception_path = std::filesystem::path(j["exception_path"].get<std::string>());
    }

    if (j.contains("log_level"))
    {
        if (!j["log_level"].is_string())
            throw std::runtime_error("Manager config: 'log_level' must be a string in '" +
                                     origin + "'");
        cfg.log_level = j["log_level"].get<std::string>();
        if (!utils::Logger::level_from_string(cfg.log_level))
            throw std::runtime_error("Manager config: invalid 'log_level' = '" + cfg.log_level +
                                     "' in '" + origin +
                                     "' (must be trace, debug, info, warning, error or critical)");
    }

    if (j.contains("log_file"))
    {
        if (!j["log_file"].is_string())
            throw std::runtime_error("Manager config: 'log_file' must be a string in '" +
                                     origin + "'");
        cfg.log_file = j["log_file"].get<std::string>();
    }

    if (j.contains("poll_interval_ms"))
        cfg.poll_interval =
            std::chrono::milliseconds(parse_positive_ms(j["poll_interval_ms"], "poll_interval_ms", origin));

    if (j.contains("handle_signals"))
    {
        if (!j["handle_signals"].is_boolean())
            throw std::runtime_error("Manager config: 'handle_signals' must be a boolean in '" +
                                     origin + "'");
        cfg.handle_signals = j["handle_signals"].get<bool>();
    }

    if (j.contains("admission"))
    {
        const auto &a = j["admission"];
        if (!a.is_object())
            throw std::runtime_error("Manager config: 'admission' must be an object in '" +
                                     origin + "'");
        if (a.contains("initial_delay_ms"))
            cfg.admission.initial_delay = std::chrono::milliseconds(
                parse_positive_ms(a["initial_delay_ms"], "admission.initial_delay_ms", origin));
        if (a.contains("max_delay_ms"))
            cfg.admission.max_delay = std::chrono::milliseconds(
                parse_positive_ms(a["max_delay_ms"], "admission.max_delay_ms", origin));
        if (cfg.admission.max_delay < cfg.admission.initial_delay)
            throw std::runtime_error("Manager config: 'admission.max_delay_ms' must not be "
                                     "smaller than 'admission.initial_delay_ms' in '" +
                                     origin + "'");
    }

    return cfg;
}

bool apply_logging_config(const ManagerConfig &cfg)
{
    if (!utils::Logger::is_running())
        return false;

    auto &logger = utils::Logger::instance();
    if (auto level = utils::Logger::level_from_string(cfg.log_level))
        logger.set_level(*level);

    if (!cfg.log_file.empty() && !logger.set_logfile(cfg.log_file))
    {
        LOGGER_ERROR("Could not switch logging to '{}'; keeping the current sink", cfg.log_file);
        return false;
    }
    return true;
}

} // namespace asyncmodules::core
