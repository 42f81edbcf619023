/**
 * @file logging.hpp
 * @brief Access to the engine's spdlog logger.
 */
#pragma once
#include "stepflow/common/common.hpp"

#include <spdlog/spdlog.h>

namespace stepflow
{

/**
 * @brief Get the shared "stepflow" logger.
 *
 * @details
 * The logger is created on first use with a colored stderr sink. If the
 * application has already registered a logger named "stepflow" with spdlog,
 * that logger is used instead, which lets hosts redirect engine output.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the level of the "stepflow" logger.
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace stepflow
