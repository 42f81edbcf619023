#include "stepflow/execution/engine.hpp"
#include "stepflow/common/errors.hpp"
#include "stepflow/common/logging.hpp"
#include "stepflow/execution/task_wrapper.hpp"

#include <algorithm>
#include <unordered_set>

namespace stepflow
{

namespace
{

using Clock = std::chrono::steady_clock;

std::chrono::nanoseconds elapsed_since(Clock::time_point start_time)
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start_time);
}

RunResult make_result(RunStatus status, const Checkpoint& checkpoint)
{
    RunResult result;
    result.status = status;
    result.thread_id = checkpoint.thread_id;
    result.superstep = checkpoint.superstep;
    result.state = checkpoint.state;
    if (status == RunStatus::Interrupted)
    {
        result.interrupt = checkpoint.pending_interrupt;
    }
    return result;
}

ErrorInfo describe(const StepflowError& e)
{
    ErrorInfo info{e.code(), e.what(), {}};
    if (auto* node_error = dynamic_cast<const NodeExecutionError*>(&e))
    {
        info.node = node_error->node();
    }
    return info;
}

/**
 * @brief Result of a call that failed; reports the last committed checkpoint.
 */
RunResult failed_result(const std::string& thread_id, const Checkpoint* committed, ErrorInfo error)
{
    logger()->warn("thread {}: {}: {}", thread_id, to_string(error.code), error.message);
    RunResult result;
    result.status = RunStatus::Failed;
    result.thread_id = thread_id;
    if (committed != nullptr)
    {
        result.superstep = committed->superstep;
        result.state = committed->state;
    }
    result.error = std::move(error);
    return result;
}

} // namespace

Engine::Engine(std::shared_ptr<const CompiledGraph> graph,
               CheckpointStorePtr store,
               EngineConfig config)
    : m_graph{std::move(graph)}
    , m_store{std::move(store)}
    , m_config{std::move(config)}
{
    if (!m_graph)
    {
        throw std::invalid_argument("Engine requires a compiled graph");
    }
    if (!m_store)
    {
        throw std::invalid_argument("Engine requires a checkpoint store");
    }
    m_executor = make_executor(m_config.executor);
}

RunResult Engine::invoke(const Value& input,
                         const std::string& thread_id,
                         const StopToken& stop,
                         EventEmitter& events)
{
    const auto start_time = Clock::now();
    std::optional<Checkpoint> existing;
    try
    {
        validate_thread_id(thread_id);
        if (!input.is_null() && !input.is_object())
        {
            throw StepflowError(ErrorCode::InvalidInput, "run input must be a JSON object or null");
        }
        existing = m_store->load(thread_id);

        if (input.is_null())
        {
            if (!existing)
            {
                throw StepflowError(ErrorCode::NoCheckpoint,
                                    "thread '" + thread_id + "' has no checkpoint to continue from");
            }
            if (existing->pending_interrupt)
            {
                logger()->info("thread {}: interrupt {} is still pending", thread_id,
                               existing->pending_interrupt->id);
                RunResult result = make_result(RunStatus::Interrupted, *existing);
                result.total_duration = elapsed_since(start_time);
                return result;
            }
            return drive(*existing, std::nullopt, stop, events, start_time);
        }

        const StateSchema& schema = *m_graph->schema;
        schema.check_update(input);

        Checkpoint checkpoint;
        if (existing)
        {
            checkpoint = *existing;
        }
        else
        {
            checkpoint.thread_id = thread_id;
            checkpoint.state = schema.make_default_state();
        }
        checkpoint.state = schema.merge(checkpoint.state, {&input});
        checkpoint.next_tasks = {m_graph->start_task()};
        checkpoint.pending_interrupt.reset();
        checkpoint.pending_writes.clear();
        m_store->save(checkpoint);
        logger()->debug("thread {}: run started at superstep {}", thread_id, checkpoint.superstep);

        return drive(std::move(checkpoint), std::nullopt, stop, events, start_time);
    }
    catch (const StepflowError& e)
    {
        RunResult result = failed_result(thread_id, existing ? &*existing : nullptr, describe(e));
        result.total_duration = elapsed_since(start_time);
        return result;
    }
    catch (const std::exception& e)
    {
        RunResult result = failed_result(thread_id, existing ? &*existing : nullptr,
                                         ErrorInfo{ErrorCode::Internal, e.what(), {}});
        result.total_duration = elapsed_since(start_time);
        return result;
    }
}

RunResult Engine::resume(const std::string& thread_id,
                         Value value,
                         const std::string& interrupt_id,
                         const StopToken& stop,
                         EventEmitter& events)
{
    const auto start_time = Clock::now();
    std::optional<Checkpoint> existing;
    try
    {
        validate_thread_id(thread_id);
        existing = m_store->load(thread_id);
        if (!existing)
        {
            throw InterruptProtocolError("thread '" + thread_id + "' has no checkpoint to resume");
        }
        if (!existing->pending_interrupt)
        {
            throw InterruptProtocolError("thread '" + thread_id + "' has no pending interrupt");
        }
        const PendingInterrupt& pending = *existing->pending_interrupt;
        if (!interrupt_id.empty() && interrupt_id != pending.id)
        {
            throw InterruptProtocolError("interrupt id '" + interrupt_id +
                                         "' does not match pending interrupt '" + pending.id + "'");
        }

        ResumePlan plan;
        plan.task_index = pending.task_index;
        plan.resume_values = pending.resume_values;
        plan.resume_values.push_back(std::move(value));
        logger()->info("thread {}: resuming interrupt {} of node {}", thread_id, pending.id, pending.node);

        // The stored interrupt stays until the superstep commits or interrupts again.
        Checkpoint checkpoint = *existing;
        checkpoint.pending_interrupt.reset();
        return drive(std::move(checkpoint), std::move(plan), stop, events, start_time);
    }
    catch (const StepflowError& e)
    {
        RunResult result = failed_result(thread_id, existing ? &*existing : nullptr, describe(e));
        result.total_duration = elapsed_since(start_time);
        return result;
    }
    catch (const std::exception& e)
    {
        RunResult result = failed_result(thread_id, existing ? &*existing : nullptr,
                                         ErrorInfo{ErrorCode::Internal, e.what(), {}});
        result.total_duration = elapsed_since(start_time);
        return result;
    }
}

RunResult Engine::drive(Checkpoint checkpoint,
                        std::optional<ResumePlan> plan,
                        const StopToken& stop,
                        EventEmitter& events,
                        Clock::time_point start_time)
{
    const StateSchema& schema = *m_graph->schema;
    std::vector<TaskTiming> timings;
    size_t supersteps_run = 0;

    auto finish = [&](RunResult result)
    {
        result.supersteps_run = supersteps_run;
        result.task_timings = std::move(timings);
        result.total_duration = elapsed_since(start_time);
        return result;
    };

    try
    {
        while (!checkpoint.next_tasks.empty())
        {
            if (stop.stop_requested())
            {
                throw StepflowError(ErrorCode::Cancelled, "run cancelled");
            }
            if (supersteps_run >= m_config.max_supersteps)
            {
                throw StepflowError(ErrorCode::SuperstepLimit,
                                    "superstep limit of " + std::to_string(m_config.max_supersteps) +
                                        " reached");
            }

            const std::vector<Task>& frontier = checkpoint.next_tasks;
            logger()->debug("thread {}: superstep {} running {} task(s)", checkpoint.thread_id,
                            checkpoint.superstep, frontier.size());

            // Tasks whose writes survived an interrupt are not run again.
            std::vector<TaskWrapperPtr> wrappers;
            std::vector<TaskWrapperPtr> by_index(frontier.size());
            for (size_t i = 0; i < frontier.size(); ++i)
            {
                if (checkpoint.pending_writes.count(i) != 0)
                {
                    continue;
                }
                std::vector<Value> resume_values;
                if (plan && plan->task_index == i)
                {
                    resume_values = plan->resume_values;
                }
                auto wrapper = std::make_shared<TaskWrapper>(
                    *m_graph, resolve_node(frontier[i].node), frontier[i], i, checkpoint.state,
                    checkpoint.thread_id, checkpoint.superstep, std::move(resume_values), &stop, &events);
                by_index[i] = wrapper;
                wrappers.push_back(std::move(wrapper));
            }
            plan.reset();

            m_executor->execute(wrappers, stop);

            if (m_config.executor.collect_timing)
            {
                for (const auto& wrapper : wrappers)
                {
                    timings.push_back(TaskTiming{checkpoint.superstep, wrapper->task().node,
                                                 wrapper->task_index(), wrapper->duration()});
                }
            }

            if (stop.stop_requested())
            {
                throw StepflowError(ErrorCode::Cancelled, "run cancelled");
            }

            for (const auto& wrapper : wrappers)
            {
                if (wrapper->state() == TaskState::Failed)
                {
                    const std::string& node = wrapper->task().node;
                    throw NodeExecutionError(node, "node '" + node + "' failed: " + wrapper->error_message());
                }
                if (wrapper->state() == TaskState::Cancelled)
                {
                    throw StepflowError(ErrorCode::Cancelled, "run cancelled");
                }
            }

            const TaskWrapper* interrupted = nullptr;
            for (const auto& wrapper : wrappers)
            {
                if (wrapper->state() != TaskState::Interrupted)
                {
                    continue;
                }
                if (interrupted != nullptr)
                {
                    throw InterruptProtocolError("nodes '" + interrupted->task().node + "' and '" +
                                                 wrapper->task().node +
                                                 "' both interrupted in the same superstep");
                }
                if (wrapper->task().has_input)
                {
                    throw InterruptProtocolError("fan-out task of node '" + wrapper->task().node +
                                                 "' cannot interrupt");
                }
                interrupted = wrapper.get();
            }

            if (interrupted != nullptr)
            {
                Checkpoint suspended = checkpoint;
                for (const auto& wrapper : wrappers)
                {
                    if (wrapper->state() == TaskState::Succeeded)
                    {
                        suspended.pending_writes[wrapper->task_index()] = wrapper->update();
                    }
                }
                const InterruptSignal& signal = *interrupted->interrupt_signal();
                suspended.pending_interrupt = PendingInterrupt{signal.id,
                                                               signal.payload,
                                                               interrupted->task().node,
                                                               interrupted->task_index(),
                                                               interrupted->resume_values()};
                m_store->save(suspended);
                logger()->info("thread {}: node {} interrupted ({})", suspended.thread_id,
                               interrupted->task().node, signal.id);
                return finish(make_result(RunStatus::Interrupted, suspended));
            }

            std::vector<const Value*> updates(frontier.size(), nullptr);
            for (size_t i = 0; i < frontier.size(); ++i)
            {
                auto it = checkpoint.pending_writes.find(i);
                updates[i] = (it != checkpoint.pending_writes.end()) ? &it->second : &by_index[i]->update();
            }
            RunState merged = schema.merge(checkpoint.state, updates);
            std::vector<Task> next = route(frontier, merged);

            Checkpoint committed;
            committed.thread_id = checkpoint.thread_id;
            committed.superstep = checkpoint.superstep + 1;
            committed.state = std::move(merged);
            committed.next_tasks = std::move(next);
            m_store->save(committed);
            logger()->trace("thread {}: checkpoint saved at superstep {}", committed.thread_id,
                            committed.superstep);

            // The wrappers reference the old state.
            wrappers.clear();
            by_index.clear();
            checkpoint = std::move(committed);
            ++supersteps_run;
        }

        logger()->info("thread {}: completed at superstep {}", checkpoint.thread_id, checkpoint.superstep);
        return finish(make_result(RunStatus::Completed, checkpoint));
    }
    catch (const StepflowError& e)
    {
        return finish(failed_result(checkpoint.thread_id, &checkpoint, describe(e)));
    }
    catch (const std::exception& e)
    {
        return finish(failed_result(checkpoint.thread_id, &checkpoint,
                                    ErrorInfo{ErrorCode::Internal, e.what(), {}}));
    }
}

std::vector<Task> Engine::route(const std::vector<Task>& frontier, const RunState& state) const
{
    std::vector<Task> next;
    std::unordered_set<std::string> scheduled;
    std::vector<bool> routed(m_graph->node_count(), false);

    auto schedule = [&next, &scheduled](const std::string& node)
    {
        if (scheduled.insert(node).second)
        {
            next.push_back(Task{node, Value{}, false});
        }
    };

    auto check_target = [this](size_t from, const std::string& target)
    {
        const std::string& source = m_graph->node_names[from];
        if (!m_graph->find_node(target))
        {
            throw NodeExecutionError(source, "router of node '" + source + "' chose unknown node '" +
                                                 target + "'");
        }
        const auto& declared = m_graph->router_targets[from];
        if (!declared.empty() && std::find(declared.begin(), declared.end(), target) == declared.end())
        {
            throw NodeExecutionError(source, "router of node '" + source + "' chose undeclared target '" +
                                                 target + "'");
        }
    };

    // Routers are functions of the merged state, so each node routes once per superstep.
    for (const Task& task : frontier)
    {
        const size_t idx = resolve_node(task.node);
        if (routed[idx])
        {
            continue;
        }
        routed[idx] = true;

        for (size_t succ : m_graph->successors[idx])
        {
            schedule(m_graph->node_names[succ]);
        }

        const RouterFn& router = m_graph->routers[idx];
        if (!router)
        {
            continue;
        }

        RouteDecision decision;
        try
        {
            decision = router(state);
        }
        catch (const std::exception& e)
        {
            throw NodeExecutionError(task.node, "router of node '" + task.node + "' failed: " + e.what());
        }

        // Halt ends only the routed branch; static successors above are already scheduled.
        if (std::holds_alternative<Halt>(decision))
        {
            continue;
        }
        if (const auto* step = std::get_if<Next>(&decision))
        {
            if (step->node == kEnd)
            {
                continue;
            }
            check_target(idx, step->node);
            schedule(step->node);
        }
        else if (const auto* fan_out = std::get_if<FanOut>(&decision))
        {
            for (const Task& target : fan_out->tasks)
            {
                check_target(idx, target.node);
                next.push_back(Task{target.node, target.input, true});
            }
        }
    }
    return next;
}

size_t Engine::resolve_node(const std::string& name) const
{
    auto idx = m_graph->find_node(name);
    if (!idx)
    {
        throw NodeExecutionError(name, "node '" + name + "' is not part of the graph");
    }
    return *idx;
}

} // namespace stepflow
