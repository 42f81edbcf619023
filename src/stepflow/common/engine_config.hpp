/**
 * @file engine_config.hpp
 * @brief Configuration structures for executors, checkpoint stores and the engine.
 */
#pragma once
#include "stepflow/common/common.hpp"

#include <spdlog/common.h>

namespace stepflow
{

/**
 * @brief Configuration for executor behavior.
 */
struct ExecutorConfig
{
    /**
     * @brief Maximum number of tasks of one superstep running at once.
     * @details 0 means use std::thread::hardware_concurrency().
     *          1 means single-threaded execution.
     */
    size_t thread_count{1};

    /**
     * @brief Whether to collect per-task timing.
     */
    bool collect_timing{false};
};

/**
 * @brief Checkpoint store backends.
 */
enum class CheckpointBackend
{
    Memory,
    File
};

/**
 * @brief Configuration for the checkpoint store.
 */
struct CheckpointConfig
{
    CheckpointBackend backend{CheckpointBackend::Memory};

    /**
     * @brief Directory holding one checkpoint file per thread.
     * @details Required for the File backend, ignored otherwise.
     */
    std::string directory;
};

/**
 * @brief Top-level engine configuration.
 */
struct EngineConfig
{
    ExecutorConfig executor{};

    CheckpointConfig checkpoint{};

    /**
     * @brief Maximum number of supersteps executed by one invoke/resume call.
     * @details Cyclic graphs rely on this cap to terminate.
     */
    size_t max_supersteps{25};

    /**
     * @brief Level applied to the shared "stepflow" logger by RunHandle.
     * @details Unset leaves the logger as the host configured it.
     */
    std::optional<spdlog::level::level_enum> log_level;
};

/**
 * @brief Build an EngineConfig from a JSON object.
 *
 * @details
 * Recognized keys: "maxConcurrency", "maxSupersteps", "collectTiming",
 * "logLevel" and "checkpoint" (with "type" = "memory" | "file" and
 * "directory"). Missing keys keep their defaults; unknown keys are ignored.
 *
 * @throws StepflowError with ErrorCode::InvalidInput on wrongly typed values.
 */
EngineConfig engine_config_from_json(const Value& json);

/**
 * @brief Read and parse an EngineConfig from a JSON file.
 * @throws StepflowError with ErrorCode::InvalidInput if the file cannot be
 *         read or parsed.
 */
EngineConfig load_engine_config(const std::string& path);

} // namespace stepflow
