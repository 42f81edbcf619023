/**
 * @file logging.cpp
 */
#include "stepflow/common/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace stepflow
{

namespace
{

constexpr const char* kLoggerName = "stepflow";

std::shared_ptr<spdlog::logger> create_logger()
{
    if (auto existing = spdlog::get(kLoggerName))
    {
        return existing;
    }
    try
    {
        auto created = spdlog::stderr_color_mt(kLoggerName);
        created->set_level(spdlog::level::info);
        return created;
    }
    catch (const spdlog::spdlog_ex&)
    {
        // Registered concurrently by another thread.
        return spdlog::get(kLoggerName);
    }
}

} // namespace

std::shared_ptr<spdlog::logger> logger()
{
    static std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
}

void set_log_level(spdlog::level::level_enum level)
{
    logger()->set_level(level);
}

} // namespace stepflow
