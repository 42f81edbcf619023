#include "stepflow/execution/events.hpp"
#include "stepflow/common/logging.hpp"

namespace stepflow
{

const char* to_string(EventType type) noexcept
{
    switch (type)
    {
        case EventType::Status:
            return "status";
        case EventType::Progress:
            return "progress";
        case EventType::Token:
            return "token";
        case EventType::Interrupt:
            return "interrupt";
        case EventType::Complete:
            return "complete";
        case EventType::Error:
            return "error";
    }
    return "unknown";
}

void to_json(Value& json, const RunEvent& event)
{
    json = Value{{"type", to_string(event.type)}};
    switch (event.type)
    {
        case EventType::Interrupt:
            json["payload"] = event.payload;
            break;
        case EventType::Complete:
            json["result"] = event.payload;
            break;
        case EventType::Error:
            json["code"] = event.payload.is_object()
                ? event.payload.value("code", std::string("unknown"))
                : std::string("unknown");
            json["message"] = event.message;
            break;
        default:
            json["message"] = event.message;
            if (!event.payload.is_null())
            {
                json["payload"] = event.payload;
            }
            break;
    }
}

void EventEmitter::emit(const RunEvent& event)
{
    if (!m_sink)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    try
    {
        m_sink(event);
    }
    catch (const std::exception& e)
    {
        logger()->warn("events: sink threw while handling '{}' event: {}",
                       to_string(event.type), e.what());
    }
    catch (...)
    {
        logger()->warn("events: sink threw a non-standard exception while handling '{}' event",
                       to_string(event.type));
    }
}

} // namespace stepflow
