/**
 * @file errors.hpp
 */
#pragma once
#include "stepflow/common/common.hpp"

namespace stepflow
{

class GraphDiagnostics;

/**
 * @brief Error codes for engine operations.
 *
 * @details
 * The first five codes form the error taxonomy visible to callers of the run
 * handle. The remaining codes describe misuse of the run handle or engine-level
 * conditions that are neither node nor persistence failures.
 */
enum class ErrorCode
{
    Compile,
    NodeExecution,
    ReducerConflict,
    CheckpointIO,
    InterruptProtocol,
    Cancelled,
    SuperstepLimit,
    InvalidThreadId,
    ThreadBusy,
    NoCheckpoint,
    InvalidInput,
    Internal
};

/**
 * @brief Get a stable, lowercase name for an error code.
 * @details Used in the `error{code, message}` event and in log lines.
 */
const char* to_string(ErrorCode code) noexcept;

/**
 * @brief Base exception class for stepflow errors.
 *
 * @details
 * `StepflowError` carries an error code and a descriptive message. Subclasses
 * exist for the codes that callers commonly want to catch by type.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class StepflowError : public std::exception
{
public:
    /**
     * @brief Construct a StepflowError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    StepflowError(ErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    ErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    ErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Thrown by GraphBuilder when the topology is invalid.
 *
 * @details
 * Raised only while a graph is being built, never while it runs. When thrown
 * from `GraphBuilder::build()` the full diagnostics are attached; when thrown
 * eagerly from a mutating call, `diagnostics()` may be null.
 */
class CompileError : public StepflowError
{
public:
    CompileError(std::string message, std::shared_ptr<GraphDiagnostics> diagnostics = nullptr)
        : StepflowError(ErrorCode::Compile, std::move(message))
        , m_diagnostics(std::move(diagnostics))
    {}

    /**
     * @brief Get the diagnostics that caused the failure, if any.
     */
    const std::shared_ptr<GraphDiagnostics>& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

private:
    std::shared_ptr<GraphDiagnostics> m_diagnostics;
};

/**
 * @brief A node body (or its router) failed.
 */
class NodeExecutionError : public StepflowError
{
public:
    NodeExecutionError(std::string node, std::string message)
        : StepflowError(ErrorCode::NodeExecution, std::move(message))
        , m_node(std::move(node))
    {}

    const std::string& node() const noexcept { return m_node; }

private:
    std::string m_node;
};

/**
 * @brief A reducer threw while merging a channel.
 */
class ReducerConflictError : public StepflowError
{
public:
    ReducerConflictError(std::string channel, std::string message)
        : StepflowError(ErrorCode::ReducerConflict, std::move(message))
        , m_channel(std::move(channel))
    {}

    const std::string& channel() const noexcept { return m_channel; }

private:
    std::string m_channel;
};

/**
 * @brief Persistence failure in a checkpoint store.
 * @note Safe to retry: a failed save never leaves a partial checkpoint behind.
 */
class CheckpointIOError : public StepflowError
{
public:
    explicit CheckpointIOError(std::string message)
        : StepflowError(ErrorCode::CheckpointIO, std::move(message))
    {}
};

/**
 * @brief Misuse of the interrupt/resume protocol.
 */
class InterruptProtocolError : public StepflowError
{
public:
    explicit InterruptProtocolError(std::string message)
        : StepflowError(ErrorCode::InterruptProtocol, std::move(message))
    {}
};

} // namespace stepflow
