/**
 * @file engine.hpp
 * @brief Engine drives a thread through supersteps and checkpoints each one.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/engine_config.hpp"
#include "stepflow/checkpoint/checkpoint_store.hpp"
#include "stepflow/execution/compiled_graph.hpp"
#include "stepflow/execution/events.hpp"
#include "stepflow/execution/executor.hpp"
#include "stepflow/execution/run_result.hpp"
#include "stepflow/execution/stop_token.hpp"

namespace stepflow
{

/**
 * @brief Superstep scheduler and interrupt/resume controller.
 *
 * @details
 * Each superstep:
 * 1. Runs every task of the frontier through the executor (the barrier)
 * 2. Inspects outcomes: cancellation, then failures, then interrupts
 * 3. Merges the updates in task-index order through the channel reducers
 * 4. Routes the merged state to the next frontier
 * 5. Saves the checkpoint; only then is the superstep committed
 *
 * A superstep that fails or is cancelled leaves nothing behind: the thread
 * stays at its previous checkpoint. A superstep in which one task interrupts
 * saves the unchanged state together with the interrupt and the writes of the
 * tasks that did finish, so that resume only re-runs the interrupted task.
 *
 * The Engine does not serialize calls for the same thread id; RunHandle does.
 *
 * @par Thread Safety
 * - Calls for different thread ids may run concurrently.
 */
class Engine
{
public:
    Engine(std::shared_ptr<const CompiledGraph> graph,
           CheckpointStorePtr store,
           EngineConfig config);

    /**
     * @brief Start a run with input, or continue the thread when input is null.
     *
     * @details
     * An object input is merged through the reducers onto the thread's current
     * state (or the channel defaults for a new thread), the frontier is reset
     * to the start node and any stale interrupt is discarded.
     *
     * A null input continues from the checkpoint: a pending interrupt is
     * reported again without running anything, and a finished thread is
     * reported as Completed.
     */
    RunResult invoke(const Value& input,
                     const std::string& thread_id,
                     const StopToken& stop,
                     EventEmitter& events);

    /**
     * @brief Answer the pending interrupt of a thread and continue the run.
     * @param interrupt_id When non-empty, must equal the pending interrupt's id.
     */
    RunResult resume(const std::string& thread_id,
                     Value value,
                     const std::string& interrupt_id,
                     const StopToken& stop,
                     EventEmitter& events);

    const CompiledGraph& graph() const noexcept { return *m_graph; }

    const ICheckpointStore& store() const noexcept { return *m_store; }

    const EngineConfig& config() const noexcept { return m_config; }

private:
    /**
     * @brief The interrupted task to re-run, with its accumulated resume values.
     */
    struct ResumePlan
    {
        size_t task_index{0};
        std::vector<Value> resume_values;
    };

    RunResult drive(Checkpoint checkpoint,
                    std::optional<ResumePlan> plan,
                    const StopToken& stop,
                    EventEmitter& events,
                    std::chrono::steady_clock::time_point start_time);

    /**
     * @brief Compute the next frontier from the merged state.
     * @throws NodeExecutionError if a router throws or names an invalid target.
     */
    std::vector<Task> route(const std::vector<Task>& frontier, const RunState& state) const;

    size_t resolve_node(const std::string& name) const;

    std::shared_ptr<const CompiledGraph> m_graph;
    CheckpointStorePtr m_store;
    EngineConfig m_config;
    std::shared_ptr<IExecutor> m_executor;
};

} // namespace stepflow
