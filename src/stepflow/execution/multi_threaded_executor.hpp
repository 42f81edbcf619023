/**
 * @file multi_threaded_executor.hpp
 * @brief MultiThreadedExecutor runs a superstep's tasks with bounded parallelism.
 */
#pragma once
#include "stepflow/execution/executor.hpp"

namespace stepflow
{

/**
 * @brief Executor running up to `thread_count` tasks of a superstep at once.
 *
 * @details
 * Each execute() call starts min(thread_count, tasks) - 1 worker threads and
 * lets the calling thread work as well. Workers claim tasks through a shared
 * cursor, so tasks start in frontier order but may finish in any order.
 * execute() joins every worker before returning, which is the superstep
 * barrier. Workers exist only for the duration of one superstep, so a
 * suspended thread holds no engine resources.
 *
 * @par Thread Safety
 * - execute() may be called concurrently for different runs.
 */
class MultiThreadedExecutor : public Executor
{
public:
    /**
     * @param config thread_count 0 means std::thread::hardware_concurrency().
     */
    explicit MultiThreadedExecutor(ExecutorConfig config = {});

    void execute(const std::vector<TaskWrapperPtr>& tasks, const StopToken& stop) override;

    /**
     * @brief Effective concurrency limit.
     */
    size_t concurrency() const noexcept { return m_concurrency; }

private:
    size_t m_concurrency{1};
};

} // namespace stepflow
