/**
 * @file single_threaded_executor.hpp
 * @brief SingleThreadedExecutor for sequential task execution.
 */
#pragma once
#include "stepflow/execution/executor.hpp"

namespace stepflow
{

/**
 * @brief Single-threaded executor for debugging and testing.
 *
 * @details
 * Runs the tasks of a superstep one after another on the calling thread, in
 * frontier order. Useful for:
 * - Debugging node code without thread complexity
 * - Reference behavior for verifying the parallel executor
 */
class SingleThreadedExecutor : public Executor
{
public:
    /**
     * @brief Construct a single-threaded executor.
     * @param config Configuration (thread_count ignored, always 1).
     */
    explicit SingleThreadedExecutor(ExecutorConfig config = {});

    void execute(const std::vector<TaskWrapperPtr>& tasks, const StopToken& stop) override;
};

/**
 * @brief Factory function to create a SingleThreadedExecutor.
 */
inline std::shared_ptr<SingleThreadedExecutor> make_single_threaded_executor(
    ExecutorConfig config = {})
{
    return std::make_shared<SingleThreadedExecutor>(std::move(config));
}

} // namespace stepflow
