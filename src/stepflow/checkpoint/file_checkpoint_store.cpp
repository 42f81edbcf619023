#include "stepflow/checkpoint/file_checkpoint_store.hpp"
#include "stepflow/common/errors.hpp"
#include "stepflow/common/logging.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace stepflow
{

namespace fs = std::filesystem;

namespace
{

constexpr const char* kRecordExtension = ".json";

std::string errno_message(int err)
{
    return std::system_category().message(err);
}

/**
 * @brief Unlinks a temporary file unless released after a successful rename.
 */
class TempFileGuard
{
public:
    explicit TempFileGuard(std::string path)
        : m_path{std::move(path)}
    {}

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    ~TempFileGuard()
    {
        if (!m_released)
        {
            ::unlink(m_path.c_str());
        }
    }

    void release() noexcept { m_released = true; }

private:
    std::string m_path;
    bool m_released{false};
};

bool is_symlink(const std::string& path)
{
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0)
    {
        int err = errno;
        if (err == ENOENT)
        {
            return false;
        }
        throw CheckpointIOError("Cannot stat '" + path + "': " + errno_message(err));
    }
    return S_ISLNK(st.st_mode);
}

void write_all(int fd, const std::string& data, const std::string& path)
{
    const char* cursor = data.data();
    size_t remaining = data.size();
    while (remaining > 0)
    {
        ssize_t written = ::write(fd, cursor, remaining);
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw CheckpointIOError("Cannot write '" + path + "': " + errno_message(errno));
        }
        cursor += written;
        remaining -= static_cast<size_t>(written);
    }
}

void sync_directory(const std::string& directory)
{
    int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0)
    {
        logger()->warn("checkpoint: cannot open '{}' to sync it: {}", directory, errno_message(errno));
        return;
    }
    if (::fsync(fd) != 0)
    {
        logger()->warn("checkpoint: cannot sync directory '{}': {}", directory, errno_message(errno));
    }
    ::close(fd);
}

} // namespace

FileCheckpointStore::FileCheckpointStore(std::string directory)
    : m_directory{std::move(directory)}
{
    if (m_directory.empty())
    {
        throw StepflowError(ErrorCode::InvalidInput, "File checkpoint store requires a directory");
    }
}

std::string FileCheckpointStore::path_for(const std::string& thread_id) const
{
    validate_thread_id(thread_id);
    return (fs::path(m_directory) / (thread_id + kRecordExtension)).string();
}

void FileCheckpointStore::ensure_directory()
{
    std::error_code ec;
    bool created = fs::create_directories(m_directory, ec);
    if (ec)
    {
        throw CheckpointIOError("Cannot create checkpoint directory '" + m_directory + "': " +
                                ec.message());
    }
    if (created)
    {
        fs::permissions(m_directory, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec)
        {
            logger()->warn("checkpoint: cannot restrict permissions of '{}': {}",
                           m_directory, ec.message());
        }
    }
}

void FileCheckpointStore::save(const Checkpoint& checkpoint)
{
    const std::string target = path_for(checkpoint.thread_id);

    std::string record;
    try
    {
        record = Value(checkpoint).dump(2);
    }
    catch (const Value::exception& e)
    {
        throw CheckpointIOError("Cannot serialize checkpoint for thread '" +
                                checkpoint.thread_id + "': " + e.what());
    }
    record.push_back('\n');

    std::lock_guard<std::mutex> lock(m_mutex);
    ensure_directory();

    if (is_symlink(target))
    {
        throw CheckpointIOError("Refusing to write checkpoint through symlink: " + target);
    }

    const std::string temp = (fs::path(m_directory) /
        ("." + checkpoint.thread_id + kRecordExtension + ".tmp-" +
         std::to_string(::getpid()) + "-" + std::to_string(++m_temp_counter))).string();

    int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600);
    if (fd < 0)
    {
        throw CheckpointIOError("Cannot create '" + temp + "': " + errno_message(errno));
    }
    TempFileGuard guard(temp);

    try
    {
        write_all(fd, record, temp);
        if (::fsync(fd) != 0)
        {
            throw CheckpointIOError("Cannot sync '" + temp + "': " + errno_message(errno));
        }
    }
    catch (...)
    {
        ::close(fd);
        throw;
    }
    if (::close(fd) != 0)
    {
        throw CheckpointIOError("Cannot close '" + temp + "': " + errno_message(errno));
    }

    if (::rename(temp.c_str(), target.c_str()) != 0)
    {
        throw CheckpointIOError("Cannot replace '" + target + "': " + errno_message(errno));
    }
    guard.release();
    sync_directory(m_directory);

    logger()->trace("checkpoint: wrote '{}' (superstep {})", target, checkpoint.superstep);
}

std::optional<Checkpoint> FileCheckpointStore::load(const std::string& thread_id)
{
    const std::string path = path_for(thread_id);

    std::lock_guard<std::mutex> lock(m_mutex);
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0)
    {
        int err = errno;
        if (err == ENOENT)
        {
            return std::nullopt;
        }
        throw CheckpointIOError("Cannot stat '" + path + "': " + errno_message(err));
    }
    if (S_ISLNK(st.st_mode))
    {
        throw CheckpointIOError("Refusing to read checkpoint through symlink: " + path);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw CheckpointIOError("Cannot open '" + path + "'");
    }
    std::string record{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

    Value json = Value::parse(record, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded())
    {
        throw CheckpointIOError("Corrupt checkpoint '" + path + "': malformed JSON");
    }

    Checkpoint checkpoint;
    try
    {
        checkpoint = json.get<Checkpoint>();
    }
    catch (const std::exception& e)
    {
        throw CheckpointIOError("Corrupt checkpoint '" + path + "': " + e.what());
    }
    if (checkpoint.thread_id != thread_id)
    {
        throw CheckpointIOError("Checkpoint '" + path + "' belongs to thread '" +
                                checkpoint.thread_id + "'");
    }
    return checkpoint;
}

bool FileCheckpointStore::remove(const std::string& thread_id)
{
    const std::string path = path_for(thread_id);

    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec)
    {
        throw CheckpointIOError("Cannot delete '" + path + "': " + ec.message());
    }
    return removed;
}

std::vector<std::string> FileCheckpointStore::list_threads()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> result;

    std::error_code ec;
    if (!fs::is_directory(m_directory, ec))
    {
        return result;
    }
    fs::directory_iterator it(m_directory, ec);
    if (ec)
    {
        throw CheckpointIOError("Cannot list '" + m_directory + "': " + ec.message());
    }
    for (const auto& entry : it)
    {
        const fs::path& path = entry.path();
        if (path.extension() != kRecordExtension)
        {
            continue;
        }
        std::string thread_id = path.stem().string();
        if (is_valid_thread_id(thread_id) && thread_id.front() != '.')
        {
            result.push_back(std::move(thread_id));
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace stepflow
