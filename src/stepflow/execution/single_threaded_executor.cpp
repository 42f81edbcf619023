#include "stepflow/execution/single_threaded_executor.hpp"

namespace stepflow
{

SingleThreadedExecutor::SingleThreadedExecutor(ExecutorConfig config)
    : Executor(std::move(config))
{
    m_config.thread_count = 1;
}

void SingleThreadedExecutor::execute(const std::vector<TaskWrapperPtr>& tasks, const StopToken& stop)
{
    for (const auto& task : tasks)
    {
        run_or_cancel(*task, stop);
    }
}

} // namespace stepflow
