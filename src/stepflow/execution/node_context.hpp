/**
 * @file node_context.hpp
 * @brief NodeContext gives a node body its inputs and its interrupt point.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/graph_items.hpp"
#include "stepflow/execution/events.hpp"
#include "stepflow/execution/stop_token.hpp"

namespace stepflow
{

namespace detail
{

/**
 * @brief Unwinds a node body suspended by NodeContext::interrupt().
 *
 * @details
 * Deliberately not derived from std::exception, so node code catching
 * `const std::exception&` does not intercept a suspension. A node body must
 * not catch it with `catch (...)` without rethrowing; a node that does and
 * then returns normally is reported as failed.
 */
struct NodeSuspended
{
};

} // namespace detail

/**
 * @brief Per-invocation view handed to a node body.
 *
 * @details
 * The state reference is a read-only snapshot of the last committed run
 * state; it does not change while the superstep runs. Updates are returned
 * from the node body and merged after the barrier.
 *
 * @par Thread Safety
 * - One NodeContext belongs to one task and is used by one thread.
 * - Event emission is safe from any task concurrently.
 */
class NodeContext
{
public:
    NodeContext(const RunState& state,
                const Task& task,
                std::string thread_id,
                uint64_t superstep,
                size_t task_index,
                std::vector<Value> resume_values,
                const StopToken* stop_token,
                EventEmitter* events);

    NodeContext(const NodeContext&) = delete;
    NodeContext& operator=(const NodeContext&) = delete;

    /**
     * @brief Read-only snapshot of the run state.
     */
    const RunState& state() const noexcept { return m_state; }

    /**
     * @brief Input override of a fan-out task; null for ordinary tasks.
     */
    const Value& input() const noexcept { return m_task.input; }

    bool has_input() const noexcept { return m_task.has_input; }

    const std::string& node_name() const noexcept { return m_task.node; }

    const std::string& thread_id() const noexcept { return m_thread_id; }

    /**
     * @brief Number of supersteps committed before the current one.
     */
    uint64_t superstep() const noexcept { return m_superstep; }

    /**
     * @brief Position of this task in the superstep's frontier.
     */
    size_t task_index() const noexcept { return m_task_index; }

    /**
     * @brief Resume values supplied to this invocation, oldest first.
     */
    const std::vector<Value>& resume_values() const noexcept { return m_resume_values; }

    /**
     * @brief Pause the run until a caller supplies a value.
     *
     * @details
     * The n-th call within one node invocation returns the n-th resume value
     * when the caller has already supplied it. Otherwise the node invocation
     * ends here: the engine checkpoints the thread with this payload as its
     * pending interrupt and returns Interrupted to the caller.
     *
     * On resume the node body runs again from its beginning, and all earlier
     * interrupt calls return their recorded values. Work done before the
     * interrupt is therefore repeated; side effects must come after the last
     * interrupt point or be idempotent.
     *
     * Fan-out tasks must not call this function: their interrupt fails the
     * superstep.
     *
     * @param payload Opaque data for the caller.
     * @param id Optional interrupt id; a deterministic id is generated if empty.
     * @return The resume value for this interrupt point.
     */
    Value interrupt(Value payload, std::string id = {});

    /**
     * @brief Number of interrupt() calls made so far in this invocation.
     */
    size_t interrupt_count() const noexcept { return m_interrupt_calls; }

    /**
     * @brief Whether the caller cancelled the run.
     */
    bool stop_requested() const noexcept
    {
        return m_stop_token != nullptr && m_stop_token->stop_requested();
    }

    void emit_status(std::string message);
    void emit_progress(std::string message);
    void emit_token(std::string text);

    /**
     * @brief Take the signal recorded by a suspending interrupt() call.
     */
    std::optional<InterruptSignal> take_suspension();

    /**
     * @brief Deterministic interrupt id for the given ordinal.
     */
    std::string make_interrupt_id(size_t ordinal) const;

private:
    void emit(EventType type, std::string message);

    const RunState& m_state;
    const Task& m_task;
    std::string m_thread_id;
    uint64_t m_superstep;
    size_t m_task_index;
    std::vector<Value> m_resume_values;
    const StopToken* m_stop_token;
    EventEmitter* m_events;

    size_t m_interrupt_calls{0};
    std::optional<InterruptSignal> m_suspension;
};

} // namespace stepflow
