/**
 * @file checkpoint.hpp
 * @brief Persisted snapshot of one thread's run.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/graph_items.hpp"
#include "stepflow/state/state_schema.hpp"

namespace stepflow
{

/**
 * @brief Version written into every checkpoint record.
 */
inline constexpr int kCheckpointFormatVersion = 1;

/**
 * @brief An interrupt waiting for a resume value.
 */
struct PendingInterrupt
{
    std::string id;

    /// Business-defined payload, transported verbatim.
    Value payload;

    /// Node that raised the interrupt.
    std::string node;

    /// Position of the interrupted task in the checkpoint's next_tasks.
    size_t task_index{0};

    /// Values already supplied to earlier interrupt points of this invocation.
    std::vector<Value> resume_values;
};

/**
 * @brief Durable snapshot of a thread.
 *
 * @details
 * Written after every committed superstep and immediately before an interrupt
 * is surfaced. `superstep` counts committed supersteps; an interrupted
 * superstep is not counted until it commits after resume.
 *
 * @par Invariants
 * - `next_tasks` is the frontier the next superstep runs; empty means the run
 *   is complete.
 * - `pending_writes` is only non-empty together with `pending_interrupt`. It
 *   holds the updates of tasks that succeeded in the interrupted superstep,
 *   keyed by task index.
 */
struct Checkpoint
{
    std::string thread_id;
    uint64_t superstep{0};
    RunState state = Value::object();
    std::vector<Task> next_tasks;
    std::optional<PendingInterrupt> pending_interrupt;
    std::map<size_t, Value> pending_writes;
};

void to_json(Value& json, const Task& task);
void from_json(const Value& json, Task& task);

void to_json(Value& json, const PendingInterrupt& interrupt);
void from_json(const Value& json, PendingInterrupt& interrupt);

/**
 * @brief Serialize a checkpoint to its persisted record.
 */
void to_json(Value& json, const Checkpoint& checkpoint);

/**
 * @brief Parse a persisted record.
 * @throws nlohmann::json::exception on malformed records, and
 *         std::invalid_argument on an unsupported version or an interrupt
 *         that points outside next_tasks.
 */
void from_json(const Value& json, Checkpoint& checkpoint);

/**
 * @brief Check a thread id against `^[A-Za-z0-9._-]{1,64}$`.
 */
bool is_valid_thread_id(const std::string& thread_id) noexcept;

/**
 * @brief Throw StepflowError (InvalidThreadId) unless the id is valid.
 */
void validate_thread_id(const std::string& thread_id);

} // namespace stepflow
