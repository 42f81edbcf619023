/**
 * @file task_wrapper.hpp
 * @brief TaskWrapper runs one task of a superstep and records its outcome.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/graph_items.hpp"
#include "stepflow/execution/compiled_graph.hpp"
#include "stepflow/execution/node_context.hpp"

namespace stepflow
{

class TaskWrapper;

using TaskWrapperPtr = std::shared_ptr<TaskWrapper>;

/**
 * @brief Execution state of a task.
 */
enum class TaskState
{
    Queued,
    Executing,
    Succeeded,
    Interrupted,
    Failed,
    Cancelled
};

/**
 * @brief Wraps one node invocation for execution by a worker.
 *
 * @details
 * TaskWrapper is the unit of work handed to an executor. It handles:
 * - Pre-execution: stop check, state transition, timing start
 * - User code execution: calling the node body with its NodeContext
 * - Post-execution: classifying the NodeResult, validating the update
 *   against the schema, capturing exceptions, timing
 *
 * The outcome (update, interrupt signal, or failure) stays in the wrapper
 * until the engine inspects it after the barrier. Nothing is merged here.
 *
 * @par Ownership Model
 * - The engine owns all TaskWrapper instances of a superstep via shared_ptr.
 * - The run state, graph, stop token and emitter are borrowed and must
 *   outlive the superstep.
 *
 * @par Thread Safety
 * - State uses an atomic; run() and cancel() may race safely.
 * - Outcome accessors are valid only after the executor's barrier.
 */
class TaskWrapper
{
public:
    /**
     * @brief Construct a TaskWrapper.
     * @param graph The compiled graph the node belongs to.
     * @param node_idx Index of the node in the graph.
     * @param task The scheduled task (node name and input override).
     * @param task_index Position of the task in the frontier.
     * @param state Snapshot of the committed run state.
     * @param thread_id Thread the task runs for.
     * @param superstep Number of supersteps committed so far.
     * @param resume_values Values for the node's interrupt points.
     * @param stop_token Cancellation flag of the run (may be null).
     * @param events Event emitter for node events (may be null).
     */
    TaskWrapper(const CompiledGraph& graph,
                size_t node_idx,
                Task task,
                size_t task_index,
                const RunState& state,
                const std::string& thread_id,
                uint64_t superstep,
                std::vector<Value> resume_values,
                const StopToken* stop_token,
                EventEmitter* events);

    // Non-copyable, non-movable
    TaskWrapper(const TaskWrapper&) = delete;
    TaskWrapper(TaskWrapper&&) = delete;
    TaskWrapper& operator=(const TaskWrapper&) = delete;
    TaskWrapper& operator=(TaskWrapper&&) = delete;

    /**
     * @brief Execute this task (called by a worker).
     *
     * @details
     * Performs the full execution lifecycle:
     * 1. Check the stop flag
     * 2. Transition to Executing state
     * 3. Call the node body
     * 4. Classify the result or catch exceptions
     * 5. Transition to Succeeded, Interrupted or Failed
     */
    void run();

    /**
     * @brief Mark this task as cancelled if it has not started.
     */
    void cancel();

    TaskState state() const noexcept
    {
        return m_state.load(std::memory_order_acquire);
    }

    const Task& task() const noexcept { return m_task; }

    size_t task_index() const noexcept { return m_task_index; }

    size_t node_idx() const noexcept { return m_node_idx; }

    /**
     * @brief The validated update (if Succeeded); null means no writes.
     */
    const Value& update() const noexcept { return m_update; }

    /**
     * @brief The interrupt raised by the node (if Interrupted).
     */
    const std::optional<InterruptSignal>& interrupt_signal() const noexcept
    {
        return m_interrupt;
    }

    /**
     * @brief Failure description (if Failed).
     */
    const std::string& error_message() const noexcept { return m_error_message; }

    /**
     * @brief The captured exception (if the node threw).
     * @return exception_ptr, or nullptr if the node did not throw.
     */
    std::exception_ptr exception() const noexcept { return m_exception; }

    const std::vector<Value>& resume_values() const noexcept
    {
        return m_context.resume_values();
    }

    /**
     * @brief Duration of the node body, or zero if it did not run.
     */
    std::chrono::nanoseconds duration() const noexcept { return m_duration; }

private:
    void record_result(NodeResult& result);

    // Configuration (immutable after construction)
    const CompiledGraph& m_graph;
    size_t m_node_idx;
    Task m_task;
    size_t m_task_index;
    const StopToken* m_stop_token;
    NodeContext m_context;

    std::atomic<TaskState> m_state{TaskState::Queued};

    // Results (written once by run())
    Value m_update;
    std::optional<InterruptSignal> m_interrupt;
    std::string m_error_message;
    std::exception_ptr m_exception{};
    std::chrono::nanoseconds m_duration{0};
};

} // namespace stepflow
