/**
 * @file checkpoint.cpp
 */
#include "stepflow/checkpoint/checkpoint.hpp"
#include "stepflow/common/errors.hpp"

namespace stepflow
{

void to_json(Value& json, const Task& task)
{
    json = Value{{"node", task.node}};
    if (task.has_input)
    {
        json["input"] = task.input;
    }
}

void from_json(const Value& json, Task& task)
{
    task.node = json.at("node").get<std::string>();
    auto input = json.find("input");
    task.has_input = input != json.end();
    task.input = task.has_input ? *input : Value{};
}

void to_json(Value& json, const PendingInterrupt& interrupt)
{
    json = Value{
        {"id", interrupt.id},
        {"payload", interrupt.payload},
        {"node", interrupt.node},
        {"taskIndex", interrupt.task_index},
        {"resumeValues", interrupt.resume_values},
    };
}

void from_json(const Value& json, PendingInterrupt& interrupt)
{
    interrupt.id = json.at("id").get<std::string>();
    interrupt.payload = json.at("payload");
    interrupt.node = json.at("node").get<std::string>();
    interrupt.task_index = json.at("taskIndex").get<size_t>();
    interrupt.resume_values = json.value("resumeValues", std::vector<Value>{});
}

void to_json(Value& json, const Checkpoint& checkpoint)
{
    Value writes = Value::object();
    for (const auto& entry : checkpoint.pending_writes)
    {
        writes[std::to_string(entry.first)] = entry.second;
    }

    json = Value{
        {"version", kCheckpointFormatVersion},
        {"threadId", checkpoint.thread_id},
        {"supersteps", checkpoint.superstep},
        {"state", checkpoint.state},
        {"nextTasks", checkpoint.next_tasks},
        {"pendingWrites", std::move(writes)},
    };
    if (checkpoint.pending_interrupt)
    {
        json["pendingInterrupt"] = *checkpoint.pending_interrupt;
    }
    else
    {
        json["pendingInterrupt"] = nullptr;
    }
}

void from_json(const Value& json, Checkpoint& checkpoint)
{
    int version = json.at("version").get<int>();
    if (version != kCheckpointFormatVersion)
    {
        throw std::invalid_argument("unsupported checkpoint version " + std::to_string(version));
    }

    checkpoint.thread_id = json.at("threadId").get<std::string>();
    checkpoint.superstep = json.at("supersteps").get<uint64_t>();
    checkpoint.state = json.at("state");
    if (!checkpoint.state.is_object())
    {
        throw std::invalid_argument("checkpoint state is not an object");
    }
    checkpoint.next_tasks = json.value("nextTasks", std::vector<Task>{});

    checkpoint.pending_writes.clear();
    if (auto writes = json.find("pendingWrites"); writes != json.end())
    {
        for (const auto& item : writes->items())
        {
            checkpoint.pending_writes.emplace(std::stoul(item.key()), item.value());
        }
    }

    checkpoint.pending_interrupt.reset();
    auto interrupt = json.find("pendingInterrupt");
    if (interrupt != json.end() && !interrupt->is_null())
    {
        checkpoint.pending_interrupt = interrupt->get<PendingInterrupt>();
        if (checkpoint.pending_interrupt->task_index >= checkpoint.next_tasks.size())
        {
            throw std::invalid_argument("pending interrupt refers to task " +
                std::to_string(checkpoint.pending_interrupt->task_index) +
                " outside the frontier");
        }
    }
}

bool is_valid_thread_id(const std::string& thread_id) noexcept
{
    if (thread_id.empty() || thread_id.size() > 64)
    {
        return false;
    }
    for (char c : thread_id)
    {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                  c == '.' || c == '_' || c == '-';
        if (!ok)
        {
            return false;
        }
    }
    return true;
}

void validate_thread_id(const std::string& thread_id)
{
    if (!is_valid_thread_id(thread_id))
    {
        throw StepflowError(ErrorCode::InvalidThreadId,
            "Invalid thread id '" + thread_id +
            "': must be 1-64 characters of letters, digits, '.', '_' or '-'");
    }
}

} // namespace stepflow
