#include "stepflow/checkpoint/memory_checkpoint_store.hpp"
#include "stepflow/common/errors.hpp"

namespace stepflow
{

void MemoryCheckpointStore::save(const Checkpoint& checkpoint)
{
    validate_thread_id(checkpoint.thread_id);
    std::string record;
    try
    {
        record = Value(checkpoint).dump();
    }
    catch (const Value::exception& e)
    {
        throw CheckpointIOError("Cannot serialize checkpoint for thread '" +
                                checkpoint.thread_id + "': " + e.what());
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records[checkpoint.thread_id] = std::move(record);
}

std::optional<Checkpoint> MemoryCheckpointStore::load(const std::string& thread_id)
{
    std::string record;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(thread_id);
        if (it == m_records.end())
        {
            return std::nullopt;
        }
        record = it->second;
    }
    try
    {
        return Value::parse(record).get<Checkpoint>();
    }
    catch (const std::exception& e)
    {
        throw CheckpointIOError("Cannot read checkpoint for thread '" + thread_id + "': " + e.what());
    }
}

bool MemoryCheckpointStore::remove(const std::string& thread_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.erase(thread_id) != 0;
}

std::vector<std::string> MemoryCheckpointStore::list_threads()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> result;
    result.reserve(m_records.size());
    for (const auto& entry : m_records)
    {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace stepflow
