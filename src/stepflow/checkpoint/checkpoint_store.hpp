/**
 * @file checkpoint_store.hpp
 * @brief ICheckpointStore interface and store factory.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/engine_config.hpp"
#include "stepflow/checkpoint/checkpoint.hpp"

namespace stepflow
{

/**
 * @brief Interface for checkpoint persistence.
 *
 * @details
 * The store is the single source of truth for whether a thread has ever run
 * and what its latest state is. It keeps one checkpoint per thread id; each
 * save replaces the previous one.
 *
 * @par Atomicity
 * save() is atomic: a concurrent or later load() observes either the previous
 * checkpoint or the new one, never a mixture or a truncated record.
 *
 * @par Thread Safety
 * - Implementations must allow concurrent calls from any thread.
 */
class ICheckpointStore
{
public:
    virtual ~ICheckpointStore() = default;

    /**
     * @brief Replace the thread's checkpoint.
     * @throws CheckpointIOError if the checkpoint cannot be persisted. The
     *         previous checkpoint is then still in place.
     */
    virtual void save(const Checkpoint& checkpoint) = 0;

    /**
     * @brief Load the thread's latest checkpoint.
     * @return The checkpoint, or std::nullopt if the thread never ran.
     * @throws CheckpointIOError if a stored record cannot be read or parsed.
     */
    virtual std::optional<Checkpoint> load(const std::string& thread_id) = 0;

    /**
     * @brief Delete the thread's checkpoint.
     * @return True if a checkpoint existed.
     * @throws CheckpointIOError on I/O failure.
     */
    virtual bool remove(const std::string& thread_id) = 0;

    /**
     * @brief List thread ids that have a checkpoint, sorted.
     */
    virtual std::vector<std::string> list_threads() = 0;
};

using CheckpointStorePtr = std::shared_ptr<ICheckpointStore>;

/**
 * @brief Create the store selected by the configuration.
 * @throws StepflowError (InvalidInput) if the File backend has no directory.
 */
CheckpointStorePtr make_checkpoint_store(const CheckpointConfig& config);

} // namespace stepflow
