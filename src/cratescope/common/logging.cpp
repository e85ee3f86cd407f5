/**
 * @file logging.cpp
 */
#include "cratescope/common/logging.hpp"
#include "cratescope/common/graph_exceptions.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace cratescope
{

void init_logging(const std::string& level)
{
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    // from_str() maps unknown names to off
    if (parsed == spdlog::level::off && level != "off")
    {
        throw CrateGraphError(CrateGraphErrorCode::InvalidOption,
                              "Unknown log level '" + level +
                                  "'; expected trace, debug, info, warn, error, critical or off");
    }

    spdlog::drop(k_logger_name);
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(k_logger_name, std::move(sink));
    logger->set_pattern("[%^%l%$] %v");
    logger->set_level(parsed);
    spdlog::set_default_logger(logger);

    spdlog::cfg::load_env_levels();
}

} // namespace cratescope
