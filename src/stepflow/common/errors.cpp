/**
 * @file errors.cpp
 */
#include "stepflow/common/errors.hpp"

namespace stepflow
{

const char* to_string(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::Compile:
            return "compile_error";
        case ErrorCode::NodeExecution:
            return "node_execution_error";
        case ErrorCode::ReducerConflict:
            return "reducer_conflict_error";
        case ErrorCode::CheckpointIO:
            return "checkpoint_io_error";
        case ErrorCode::InterruptProtocol:
            return "interrupt_protocol_error";
        case ErrorCode::Cancelled:
            return "cancelled";
        case ErrorCode::SuperstepLimit:
            return "superstep_limit";
        case ErrorCode::InvalidThreadId:
            return "invalid_thread_id";
        case ErrorCode::ThreadBusy:
            return "thread_busy";
        case ErrorCode::NoCheckpoint:
            return "no_checkpoint";
        case ErrorCode::InvalidInput:
            return "invalid_input";
        case ErrorCode::Internal:
            return "internal_error";
    }
    return "unknown";
}

} // namespace stepflow
