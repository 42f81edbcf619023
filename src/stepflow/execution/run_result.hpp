/**
 * @file run_result.hpp
 * @brief Definition of RunResult returned by RunHandle::invoke() and resume().
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/errors.hpp"
#include "stepflow/checkpoint/checkpoint.hpp"

namespace stepflow
{

/**
 * @brief Terminal status of one invoke/resume call.
 */
enum class RunStatus
{
    Completed,
    Interrupted,
    Failed
};

inline const char* to_string(RunStatus status) noexcept
{
    switch (status)
    {
        case RunStatus::Completed:
            return "completed";
        case RunStatus::Interrupted:
            return "interrupted";
        case RunStatus::Failed:
            return "failed";
    }
    return "unknown";
}

/**
 * @brief Description of a failed call.
 */
struct ErrorInfo
{
    ErrorCode code{ErrorCode::Internal};
    std::string message;

    /// Node responsible for the failure; empty when no node is involved.
    std::string node;
};

/**
 * @brief Timing of one task, collected when ExecutorConfig::collect_timing is set.
 */
struct TaskTiming
{
    uint64_t superstep{0};
    std::string node;
    size_t task_index{0};
    std::chrono::nanoseconds duration{0};
};

/**
 * @brief Result of one invoke/resume call.
 *
 * @details
 * RunResult captures the outcome of driving a thread:
 * - Exactly one status: Completed, Interrupted or Failed
 * - The state of the thread's latest checkpoint
 * - The pending interrupt (if Interrupted)
 * - The error (if Failed)
 * - Counters and timing information
 *
 * A Failed result never corresponds to a partially applied superstep: `state`
 * is the last committed state.
 */
struct RunResult
{
    RunStatus status{RunStatus::Completed};

    std::string thread_id;

    /**
     * @brief Committed supersteps of the thread after the call.
     */
    uint64_t superstep{0};

    /**
     * @brief Run state of the thread's latest checkpoint.
     */
    RunState state;

    /**
     * @brief The interrupt waiting for a resume value (if Interrupted).
     */
    std::optional<PendingInterrupt> interrupt;

    std::optional<ErrorInfo> error;

    /**
     * @brief Supersteps committed by this call.
     */
    size_t supersteps_run{0};

    /**
     * @brief Total duration of the call (wall-clock time).
     */
    std::chrono::nanoseconds total_duration{0};

    /**
     * @brief Per-task durations, in execution order.
     * @details Only populated if timing collection is enabled.
     */
    std::vector<TaskTiming> task_timings;

    bool completed() const noexcept { return status == RunStatus::Completed; }
    bool interrupted() const noexcept { return status == RunStatus::Interrupted; }
    bool failed() const noexcept { return status == RunStatus::Failed; }

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result = "Run ";
        result += to_string(status);
        result += " (thread=" + thread_id;
        result += ", superstep=" + std::to_string(superstep);
        result += ", supersteps_run=" + std::to_string(supersteps_run) + ")";
        if (interrupt)
        {
            result += " interrupt=" + interrupt->id;
        }
        if (error)
        {
            result += std::string(" error=") + stepflow::to_string(error->code) + ": " + error->message;
        }
        return result;
    }
};

} // namespace stepflow
