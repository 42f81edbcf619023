#include "stepflow/execution/executor.hpp"
#include "stepflow/execution/multi_threaded_executor.hpp"
#include "stepflow/execution/single_threaded_executor.hpp"

namespace stepflow
{

Executor::Executor(ExecutorConfig config)
    : m_config{std::move(config)}
{}

void Executor::run_or_cancel(TaskWrapper& task, const StopToken& stop)
{
    if (stop.stop_requested())
    {
        task.cancel();
        return;
    }
    task.run();
}

std::shared_ptr<IExecutor> make_executor(const ExecutorConfig& config)
{
    if (config.thread_count == 1)
    {
        return make_single_threaded_executor(config);
    }
    return std::make_shared<MultiThreadedExecutor>(config);
}

} // namespace stepflow
