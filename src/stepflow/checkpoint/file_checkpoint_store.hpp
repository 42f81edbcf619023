/**
 * @file file_checkpoint_store.hpp
 * @brief Durable, file-based checkpoint store.
 */
#pragma once
#include "stepflow/checkpoint/checkpoint_store.hpp"

namespace stepflow
{

/**
 * @brief Checkpoint store keeping one JSON file per thread in a directory.
 *
 * @details
 * Checkpoints survive the process, so a thread interrupted in one process can
 * be resumed in another.
 *
 * @par Atomic replace
 * save() writes the record to a uniquely named temporary file in the same
 * directory (mode 0600), flushes it with fsync(), and rename()s it over
 * `<directory>/<thread_id>.json`. A reader sees the old or the new record and
 * never a partial one. The temporary file is removed if any step fails.
 *
 * @par Symlinks
 * The store refuses to write or read through a symbolic link at a checkpoint
 * path.
 *
 * @par Thread Safety
 * - Calls are serialized by an internal mutex.
 * - Several processes may share a directory; each save is still atomic, but
 *   concurrent writers to the same thread id race (last rename wins).
 */
class FileCheckpointStore : public ICheckpointStore
{
public:
    /**
     * @brief Construct a store rooted at `directory`.
     * @details The directory is created (mode 0700) on the first save.
     */
    explicit FileCheckpointStore(std::string directory);

    void save(const Checkpoint& checkpoint) override;
    std::optional<Checkpoint> load(const std::string& thread_id) override;
    bool remove(const std::string& thread_id) override;
    std::vector<std::string> list_threads() override;

    const std::string& directory() const noexcept { return m_directory; }

    /**
     * @brief Path of the record for a thread id.
     * @throws StepflowError (InvalidThreadId) for ids outside the safe pattern.
     */
    std::string path_for(const std::string& thread_id) const;

private:
    void ensure_directory();

    std::string m_directory;
    std::mutex m_mutex;
    uint64_t m_temp_counter{0};
};

} // namespace stepflow
