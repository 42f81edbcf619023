#include "stepflow/execution/multi_threaded_executor.hpp"
#include "stepflow/common/logging.hpp"

#include <algorithm>
#include <system_error>
#include <thread>

namespace stepflow
{

MultiThreadedExecutor::MultiThreadedExecutor(ExecutorConfig config)
    : Executor(std::move(config))
{
    m_concurrency = m_config.thread_count;
    if (m_concurrency == 0)
    {
        m_concurrency = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
}

void MultiThreadedExecutor::execute(const std::vector<TaskWrapperPtr>& tasks, const StopToken& stop)
{
    if (tasks.empty())
    {
        return;
    }

    std::atomic<size_t> cursor{0};
    auto work = [&tasks, &stop, &cursor]()
    {
        for (;;)
        {
            size_t idx = cursor.fetch_add(1, std::memory_order_acq_rel);
            if (idx >= tasks.size())
            {
                return;
            }
            run_or_cancel(*tasks[idx], stop);
        }
    };

    const size_t worker_count = std::min(m_concurrency, tasks.size());
    std::vector<std::thread> workers;
    workers.reserve(worker_count > 0 ? worker_count - 1 : 0);
    try
    {
        for (size_t i = 1; i < worker_count; ++i)
        {
            workers.emplace_back(work);
        }
    }
    catch (const std::system_error& e)
    {
        // Fewer workers than requested; the calling thread still drains the queue.
        logger()->warn("executor: started {} of {} worker threads: {}",
                       workers.size(), worker_count - 1, e.what());
    }

    work();

    for (auto& worker : workers)
    {
        worker.join();
    }
}

} // namespace stepflow
