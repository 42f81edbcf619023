/**
 * @file state_schema.hpp
 * @brief Channel declarations and the superstep merge.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/state/reducer.hpp"

namespace stepflow
{

/**
 * @brief Run state: a JSON object mapping channel name to channel value.
 */
using RunState = Value;

/**
 * @brief Declaration of one state channel.
 */
struct ChannelSpec
{
    std::string name;
    Reducer reducer;
    Value default_value;
};

/**
 * @brief Ordered list of channel declarations.
 *
 * @details
 * Channels are the only shared data visible to nodes. A StateSchema is built
 * once, handed to the GraphBuilder, and shared read-only by every run of the
 * compiled graph.
 *
 * @par Thread Safety
 * - No internal synchronization.
 * - Const methods are safe for concurrent use once construction is finished.
 */
class StateSchema
{
public:
    StateSchema() = default;

    /**
     * @brief Construct from a list of channel declarations.
     * @throws StepflowError (InvalidInput) on empty or duplicate names, or a
     *         missing reducer.
     */
    explicit StateSchema(std::vector<ChannelSpec> channels);

    /**
     * @brief Declare a channel.
     * @throws StepflowError (InvalidInput) on empty or duplicate names, or a
     *         missing reducer.
     */
    StateSchema& add_channel(std::string name, Reducer reducer, Value default_value = nullptr);

    bool has_channel(const std::string& name) const noexcept
    {
        return m_index.count(name) != 0;
    }

    size_t channel_count() const noexcept
    {
        return m_channels.size();
    }

    const std::vector<ChannelSpec>& channels() const noexcept
    {
        return m_channels;
    }

    /**
     * @brief Create a state holding every channel's default value.
     */
    RunState make_default_state() const;

    /**
     * @brief Verify that an update is an object naming declared channels only.
     * @details A null update is accepted and means "no writes".
     * @throws StepflowError (InvalidInput) describing the first offending key.
     */
    void check_update(const Value& update) const;

    /**
     * @brief Apply a superstep's updates to a state.
     *
     * @details
     * Channels are processed in declaration order. Within a channel, updates
     * are applied in the order given, which the engine sets to task index.
     * The input state is left unchanged.
     *
     * @param state The last committed state.
     * @param updates Updates of the superstep, in task-index order. Null
     *        entries are skipped.
     * @return The merged state.
     * @throws ReducerConflictError if a reducer throws.
     */
    RunState merge(const RunState& state, const std::vector<const Value*>& updates) const;

private:
    std::vector<ChannelSpec> m_channels;
    std::unordered_map<std::string, size_t> m_index;
};

} // namespace stepflow
