/**
 * @file logging.hpp
 * @brief spdlog setup for the cratescope executable and tests.
 */
#pragma once
#include "cratescope/common/common.hpp"

namespace cratescope
{

/// Name of the logger installed by `init_logging()`.
inline constexpr const char* k_logger_name = "cratescope";

/**
 * @brief Install a stderr logger named `cratescope` as the spdlog default logger.
 *
 * @details
 * `level` is one of `trace`, `debug`, `info`, `warn`, `error`, `critical`, `off`. Levels
 * from the `SPDLOG_LEVEL` environment variable are applied afterwards and take
 * precedence. Calling this again replaces the previous logger.
 *
 * @throw CrateGraphError with `InvalidOption` for an unknown level name.
 */
void init_logging(const std::string& level);

} // namespace cratescope
