/**
 * @file run_handle.hpp
 * @brief RunHandle is the public entry point for running compiled graphs.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/engine_config.hpp"
#include "stepflow/checkpoint/checkpoint_store.hpp"
#include "stepflow/execution/compiled_graph.hpp"
#include "stepflow/execution/engine.hpp"
#include "stepflow/execution/events.hpp"
#include "stepflow/execution/run_result.hpp"

namespace stepflow
{

/**
 * @brief Caller-facing surface of a compiled graph bound to a checkpoint store.
 *
 * @details
 * Every invoke()/resume() call returns exactly one of Completed, Interrupted
 * or Failed, and ends its event stream with the matching `complete`,
 * `interrupt` or `error` event. Run-time errors never escape as exceptions.
 *
 * Only one call may be in flight per thread id; a second concurrent call for
 * the same thread fails with ErrorCode::ThreadBusy. Calls for different
 * thread ids run independently and may share one RunHandle.
 *
 * Usage:
 * @code
 *     RunHandle runs(graph, std::make_shared<MemoryCheckpointStore>());
 *     RunResult first = runs.invoke(Value{{"topic", "auth"}}, "t-1");
 *     if (first.interrupted())
 *     {
 *         RunResult second = runs.resume("t-1", "approve");
 *     }
 * @endcode
 *
 * @par Thread Safety
 * - All methods may be called from any thread.
 */
class RunHandle
{
public:
    RunHandle(std::shared_ptr<const CompiledGraph> graph,
              CheckpointStorePtr store,
              EngineConfig config = {});

    /**
     * @brief Construct with the checkpoint store selected by `config.checkpoint`.
     * @throws StepflowError (InvalidInput) if the store configuration is invalid.
     */
    RunHandle(std::shared_ptr<const CompiledGraph> graph, const EngineConfig& config);

    RunHandle(const RunHandle&) = delete;
    RunHandle& operator=(const RunHandle&) = delete;

    /**
     * @brief Start a run, or continue one when `input` is null.
     * @param input JSON object merged into the state, or null.
     * @param thread_id Identity of the run, `^[A-Za-z0-9._-]{1,64}$`.
     * @param sink Optional event callback; called from worker threads too.
     */
    RunResult invoke(const Value& input, const std::string& thread_id, EventSink sink = {});

    /**
     * @brief Answer the thread's pending interrupt and continue the run.
     * @param interrupt_id When non-empty, must match the pending interrupt.
     */
    RunResult resume(const std::string& thread_id,
                     Value value,
                     EventSink sink = {},
                     const std::string& interrupt_id = {});

    /**
     * @brief Latest checkpoint of a thread.
     * @return The checkpoint, or std::nullopt if the thread never ran.
     * @throws StepflowError (InvalidThreadId), CheckpointIOError
     */
    std::optional<Checkpoint> get_state(const std::string& thread_id) const;

    /**
     * @brief Delete a thread's checkpoint.
     * @return True if the thread existed.
     * @throws StepflowError (InvalidThreadId or ThreadBusy), CheckpointIOError
     */
    bool delete_thread(const std::string& thread_id);

    /**
     * @brief Request cancellation of the thread's in-flight call.
     *
     * @details
     * Tasks not yet started are skipped, running nodes may observe
     * NodeContext::stop_requested(), and the superstep is discarded. The call
     * returns Failed with ErrorCode::Cancelled.
     *
     * @return True if a call was in flight.
     */
    bool cancel(const std::string& thread_id);

    /**
     * @brief Whether a call for the thread is in flight.
     */
    bool is_running(const std::string& thread_id) const;

    const CheckpointStorePtr& store() const noexcept { return m_store; }

    const CompiledGraph& graph() const noexcept { return *m_graph; }

private:
    class ActiveRun;

    RunResult busy_result(const std::string& thread_id) const;

    static void emit_terminal(EventEmitter& events, const RunResult& result);

    std::shared_ptr<const CompiledGraph> m_graph;
    CheckpointStorePtr m_store;
    Engine m_engine;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<StopToken>> m_active;
};

} // namespace stepflow
