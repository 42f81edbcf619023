/**
 * @file executor.hpp
 * @brief IExecutor interface and executor factory.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/engine_config.hpp"
#include "stepflow/execution/stop_token.hpp"
#include "stepflow/execution/task_wrapper.hpp"

namespace stepflow
{

/**
 * @brief Interface for superstep executors.
 *
 * @details
 * An executor runs every task of one superstep and returns only when all of
 * them have finished or been cancelled: execute() is the superstep barrier.
 * Implementations may run tasks sequentially or in parallel.
 *
 * @par Thread Safety
 * - execute() may be called from any thread, and concurrently for different
 *   runs; it keeps no state between calls.
 */
class IExecutor
{
public:
    virtual ~IExecutor() = default;

    /**
     * @brief Run a superstep's tasks to completion.
     * @param tasks The frontier's tasks, all in Queued state.
     * @param stop Cancellation flag; once set, tasks not yet started are
     *        cancelled.
     */
    virtual void execute(const std::vector<TaskWrapperPtr>& tasks, const StopToken& stop) = 0;
};

/**
 * @brief Base class for Executor implementations.
 */
class Executor : public IExecutor
{
public:
    explicit Executor(ExecutorConfig config);

    const ExecutorConfig& config() const noexcept { return m_config; }

protected:
    /**
     * @brief Run one task, or cancel it if a stop was requested.
     */
    static void run_or_cancel(TaskWrapper& task, const StopToken& stop);

    ExecutorConfig m_config;
};

/**
 * @brief Create the executor matching the configuration.
 * @details thread_count 1 yields a SingleThreadedExecutor, anything else a
 *          MultiThreadedExecutor.
 */
std::shared_ptr<IExecutor> make_executor(const ExecutorConfig& config);

} // namespace stepflow
