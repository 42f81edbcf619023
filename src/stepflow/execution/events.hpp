/**
 * @file events.hpp
 * @brief Caller event stream.
 */
#pragma once
#include "stepflow/common/common.hpp"

namespace stepflow
{

/**
 * @brief Kinds of events delivered to callers.
 *
 * @details
 * Status, Progress and Token originate in node bodies and are passed through.
 * Interrupt, Complete and Error are emitted by the run handle when a call
 * ends, exactly one per call.
 */
enum class EventType
{
    Status,
    Progress,
    Token,
    Interrupt,
    Complete,
    Error
};

const char* to_string(EventType type) noexcept;

/**
 * @brief One event on the caller stream.
 *
 * @details
 * - Status/Progress/Token: `message` carries the text.
 * - Interrupt: `payload` is the node's interrupt payload.
 * - Complete: `payload` is the final run state.
 * - Error: `message` is the error message, `payload` holds `{"code": ...}`.
 */
struct RunEvent
{
    EventType type{EventType::Status};
    std::string message;
    Value payload;
};

/**
 * @brief Wire form: `{type, message?, payload?}` for node events,
 * `{type:"interrupt", payload}`, `{type:"complete", result}` and
 * `{type:"error", code, message}`.
 */
void to_json(Value& json, const RunEvent& event);

using EventSink = std::function<void(const RunEvent&)>;

/**
 * @brief Forwards events to a sink, one at a time.
 *
 * @details
 * Node events may be emitted concurrently from worker threads; delivery is
 * serialized by a mutex and happens immediately, without buffering. An
 * exception thrown by the sink is logged and does not affect the run.
 */
class EventEmitter
{
public:
    explicit EventEmitter(EventSink sink = {})
        : m_sink{std::move(sink)}
    {}

    void emit(const RunEvent& event);

    bool has_sink() const noexcept { return static_cast<bool>(m_sink); }

private:
    EventSink m_sink;
    std::mutex m_mutex;
};

} // namespace stepflow
