/**
 * @file stop_token.hpp
 */
#pragma once
#include "stepflow/common/common.hpp"

namespace stepflow
{

/**
 * @brief Cooperative cancellation flag for one run.
 *
 * @details
 * Set by RunHandle::cancel() from any thread. Executors stop starting queued
 * tasks once it is set, and node bodies may poll it through NodeContext.
 * Tasks already executing are not preempted.
 */
class StopToken
{
public:
    void request_stop() noexcept
    {
        m_stop_requested.store(true, std::memory_order_release);
    }

    bool stop_requested() const noexcept
    {
        return m_stop_requested.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> m_stop_requested{false};
};

} // namespace stepflow
