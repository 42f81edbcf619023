#include "stepflow/execution/task_wrapper.hpp"

namespace stepflow
{

TaskWrapper::TaskWrapper(const CompiledGraph& graph,
                         size_t node_idx,
                         Task task,
                         size_t task_index,
                         const RunState& state,
                         const std::string& thread_id,
                         uint64_t superstep,
                         std::vector<Value> resume_values,
                         const StopToken* stop_token,
                         EventEmitter* events)
    : m_graph{graph}
    , m_node_idx{node_idx}
    , m_task{std::move(task)}
    , m_task_index{task_index}
    , m_stop_token{stop_token}
    , m_context{state, m_task, thread_id, superstep, task_index,
                std::move(resume_values), stop_token, events}
{}

void TaskWrapper::run()
{
    // Check stop request before starting
    if (m_stop_token != nullptr && m_stop_token->stop_requested())
    {
        cancel();
        return;
    }

    TaskState expected = TaskState::Queued;
    if (!m_state.compare_exchange_strong(expected, TaskState::Executing,
                                         std::memory_order_acq_rel))
    {
        // Already cancelled
        return;
    }

    auto start_time = std::chrono::steady_clock::now();
    TaskState final_state = TaskState::Failed;

    try
    {
        NodeResult result = m_graph.node_fns[m_node_idx](m_context);
        if (auto swallowed = m_context.take_suspension())
        {
            m_error_message = "node caught its own interrupt '" + swallowed->id +
                              "' and returned normally";
        }
        else
        {
            record_result(result);
        }
        if (m_interrupt)
        {
            final_state = TaskState::Interrupted;
        }
        else if (m_error_message.empty())
        {
            final_state = TaskState::Succeeded;
        }
    }
    catch (const detail::NodeSuspended&)
    {
        m_interrupt = m_context.take_suspension();
        final_state = TaskState::Interrupted;
    }
    catch (const std::exception& e)
    {
        m_exception = std::current_exception();
        m_error_message = e.what();
        if (m_error_message.empty())
        {
            m_error_message = "exception without message";
        }
    }
    catch (...)
    {
        m_exception = std::current_exception();
        m_error_message = "unknown exception";
    }

    auto end_time = std::chrono::steady_clock::now();
    m_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time);

    m_state.store(final_state, std::memory_order_release);
}

void TaskWrapper::record_result(NodeResult& result)
{
    if (auto* update = std::get_if<Update>(&result))
    {
        // Throws on writes to undeclared channels; reported as a node failure.
        m_graph.schema->check_update(*update);
        m_update = std::move(*update);
        return;
    }
    if (auto* signal = std::get_if<InterruptSignal>(&result))
    {
        if (signal->id.empty())
        {
            signal->id = m_context.make_interrupt_id(m_context.interrupt_count());
        }
        m_interrupt = std::move(*signal);
        return;
    }
    auto& error = std::get<NodeError>(result);
    m_error_message = error.message.empty() ? "node reported an error" : std::move(error.message);
}

void TaskWrapper::cancel()
{
    TaskState expected = TaskState::Queued;
    m_state.compare_exchange_strong(expected, TaskState::Cancelled, std::memory_order_acq_rel);
}

} // namespace stepflow
