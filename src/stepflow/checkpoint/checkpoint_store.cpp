#include "stepflow/checkpoint/checkpoint_store.hpp"
#include "stepflow/checkpoint/file_checkpoint_store.hpp"
#include "stepflow/checkpoint/memory_checkpoint_store.hpp"
#include "stepflow/common/errors.hpp"

namespace stepflow
{

CheckpointStorePtr make_checkpoint_store(const CheckpointConfig& config)
{
    switch (config.backend)
    {
        case CheckpointBackend::Memory:
            return std::make_shared<MemoryCheckpointStore>();
        case CheckpointBackend::File:
            return std::make_shared<FileCheckpointStore>(config.directory);
    }
    throw StepflowError(ErrorCode::InvalidInput, "Unknown checkpoint backend");
}

} // namespace stepflow
