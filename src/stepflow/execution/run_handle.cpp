#include "stepflow/execution/run_handle.hpp"
#include "stepflow/common/errors.hpp"
#include "stepflow/common/logging.hpp"

namespace stepflow
{

/**
 * @brief Registers a thread id as in flight for the lifetime of a call.
 */
class RunHandle::ActiveRun
{
public:
    ActiveRun(RunHandle& owner, const std::string& thread_id)
        : m_owner{owner}
        , m_thread_id{thread_id}
    {
        std::lock_guard<std::mutex> lock(m_owner.m_mutex);
        auto inserted = m_owner.m_active.emplace(m_thread_id, std::make_shared<StopToken>());
        m_registered = inserted.second;
        if (m_registered)
        {
            m_stop = inserted.first->second;
        }
    }

    ~ActiveRun()
    {
        if (m_registered)
        {
            std::lock_guard<std::mutex> lock(m_owner.m_mutex);
            m_owner.m_active.erase(m_thread_id);
        }
    }

    ActiveRun(const ActiveRun&) = delete;
    ActiveRun& operator=(const ActiveRun&) = delete;

    bool registered() const noexcept { return m_registered; }

    const StopToken& stop() const noexcept { return *m_stop; }

private:
    RunHandle& m_owner;
    std::string m_thread_id;
    bool m_registered{false};
    std::shared_ptr<StopToken> m_stop;
};

RunHandle::RunHandle(std::shared_ptr<const CompiledGraph> graph,
                     CheckpointStorePtr store,
                     EngineConfig config)
    : m_graph{graph}
    , m_store{store}
    , m_engine{std::move(graph), std::move(store), config}
{
    if (config.log_level)
    {
        set_log_level(*config.log_level);
    }
}

RunHandle::RunHandle(std::shared_ptr<const CompiledGraph> graph, const EngineConfig& config)
    : RunHandle(std::move(graph), make_checkpoint_store(config.checkpoint), config)
{}

RunResult RunHandle::invoke(const Value& input, const std::string& thread_id, EventSink sink)
{
    EventEmitter events{std::move(sink)};
    ActiveRun active{*this, thread_id};
    if (!active.registered())
    {
        RunResult result = busy_result(thread_id);
        emit_terminal(events, result);
        return result;
    }
    RunResult result = m_engine.invoke(input, thread_id, active.stop(), events);
    logger()->debug("{}", result.summary());
    emit_terminal(events, result);
    return result;
}

RunResult RunHandle::resume(const std::string& thread_id,
                            Value value,
                            EventSink sink,
                            const std::string& interrupt_id)
{
    EventEmitter events{std::move(sink)};
    ActiveRun active{*this, thread_id};
    if (!active.registered())
    {
        RunResult result = busy_result(thread_id);
        emit_terminal(events, result);
        return result;
    }
    RunResult result = m_engine.resume(thread_id, std::move(value), interrupt_id, active.stop(), events);
    logger()->debug("{}", result.summary());
    emit_terminal(events, result);
    return result;
}

std::optional<Checkpoint> RunHandle::get_state(const std::string& thread_id) const
{
    validate_thread_id(thread_id);
    return m_store->load(thread_id);
}

bool RunHandle::delete_thread(const std::string& thread_id)
{
    validate_thread_id(thread_id);
    ActiveRun active{*this, thread_id};
    if (!active.registered())
    {
        throw StepflowError(ErrorCode::ThreadBusy,
                            "thread '" + thread_id + "' has a call in flight");
    }
    bool removed = m_store->remove(thread_id);
    if (removed)
    {
        logger()->info("thread {}: deleted", thread_id);
    }
    return removed;
}

bool RunHandle::cancel(const std::string& thread_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_active.find(thread_id);
    if (it == m_active.end())
    {
        return false;
    }
    it->second->request_stop();
    logger()->info("thread {}: cancellation requested", thread_id);
    return true;
}

bool RunHandle::is_running(const std::string& thread_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.count(thread_id) != 0;
}

RunResult RunHandle::busy_result(const std::string& thread_id) const
{
    RunResult result;
    result.status = RunStatus::Failed;
    result.thread_id = thread_id;
    result.error = ErrorInfo{ErrorCode::ThreadBusy,
                             "thread '" + thread_id + "' already has a call in flight", {}};
    logger()->warn("thread {}: {}", thread_id, result.error->message);
    return result;
}

void RunHandle::emit_terminal(EventEmitter& events, const RunResult& result)
{
    RunEvent event;
    switch (result.status)
    {
        case RunStatus::Completed:
            event.type = EventType::Complete;
            event.payload = result.state;
            break;
        case RunStatus::Interrupted:
            event.type = EventType::Interrupt;
            event.message = result.interrupt ? result.interrupt->id : std::string{};
            event.payload = result.interrupt ? result.interrupt->payload : Value{};
            break;
        case RunStatus::Failed:
            event.type = EventType::Error;
            event.message = result.error ? result.error->message : std::string{};
            event.payload = Value{{"code", to_string(result.error ? result.error->code : ErrorCode::Internal)}};
            break;
    }
    events.emit(event);
}

} // namespace stepflow
