/**
 * @file memory_checkpoint_store.hpp
 * @brief Process-lifetime checkpoint store.
 */
#pragma once
#include "stepflow/checkpoint/checkpoint_store.hpp"

namespace stepflow
{

/**
 * @brief In-memory checkpoint store.
 *
 * @details
 * Checkpoints are kept as serialized records, so a load returns an
 * independent copy and every checkpoint is known to be serializable, exactly
 * as with the durable store. Contents are lost when the process exits.
 */
class MemoryCheckpointStore : public ICheckpointStore
{
public:
    void save(const Checkpoint& checkpoint) override;
    std::optional<Checkpoint> load(const std::string& thread_id) override;
    bool remove(const std::string& thread_id) override;
    std::vector<std::string> list_threads() override;

private:
    std::mutex m_mutex;
    std::map<std::string, std::string> m_records;
};

} // namespace stepflow
