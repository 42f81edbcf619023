#include "stepflow/execution/node_context.hpp"

namespace stepflow
{

NodeContext::NodeContext(const RunState& state,
                         const Task& task,
                         std::string thread_id,
                         uint64_t superstep,
                         size_t task_index,
                         std::vector<Value> resume_values,
                         const StopToken* stop_token,
                         EventEmitter* events)
    : m_state{state}
    , m_task{task}
    , m_thread_id{std::move(thread_id)}
    , m_superstep{superstep}
    , m_task_index{task_index}
    , m_resume_values{std::move(resume_values)}
    , m_stop_token{stop_token}
    , m_events{events}
{}

Value NodeContext::interrupt(Value payload, std::string id)
{
    size_t ordinal = m_interrupt_calls++;
    if (ordinal < m_resume_values.size())
    {
        return m_resume_values[ordinal];
    }
    if (id.empty())
    {
        id = make_interrupt_id(ordinal);
    }
    m_suspension = InterruptSignal{std::move(id), std::move(payload)};
    throw detail::NodeSuspended{};
}

std::optional<InterruptSignal> NodeContext::take_suspension()
{
    std::optional<InterruptSignal> result;
    result.swap(m_suspension);
    return result;
}

std::string NodeContext::make_interrupt_id(size_t ordinal) const
{
    return m_thread_id + ":" + std::to_string(m_superstep + 1) + ":" + m_task.node + ":" +
           std::to_string(ordinal);
}

void NodeContext::emit_status(std::string message)
{
    emit(EventType::Status, std::move(message));
}

void NodeContext::emit_progress(std::string message)
{
    emit(EventType::Progress, std::move(message));
}

void NodeContext::emit_token(std::string text)
{
    emit(EventType::Token, std::move(text));
}

void NodeContext::emit(EventType type, std::string message)
{
    if (m_events == nullptr)
    {
        return;
    }
    RunEvent event;
    event.type = type;
    event.message = std::move(message);
    m_events->emit(event);
}

} // namespace stepflow
