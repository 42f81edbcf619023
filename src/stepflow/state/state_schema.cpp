/**
 * @file state_schema.cpp
 */
#include "stepflow/state/state_schema.hpp"
#include "stepflow/common/errors.hpp"

namespace stepflow
{

StateSchema::StateSchema(std::vector<ChannelSpec> channels)
{
    for (auto& channel : channels)
    {
        add_channel(std::move(channel.name), std::move(channel.reducer),
                    std::move(channel.default_value));
    }
}

StateSchema& StateSchema::add_channel(std::string name, Reducer reducer, Value default_value)
{
    if (name.empty())
    {
        throw StepflowError(ErrorCode::InvalidInput, "Channel name must not be empty");
    }
    if (!reducer)
    {
        throw StepflowError(ErrorCode::InvalidInput, "Channel '" + name + "' has no reducer");
    }
    if (has_channel(name))
    {
        throw StepflowError(ErrorCode::InvalidInput, "Duplicate channel '" + name + "'");
    }
    m_index.emplace(name, m_channels.size());
    m_channels.push_back(ChannelSpec{std::move(name), std::move(reducer), std::move(default_value)});
    return *this;
}

RunState StateSchema::make_default_state() const
{
    RunState state = Value::object();
    for (const auto& channel : m_channels)
    {
        state[channel.name] = channel.default_value;
    }
    return state;
}

void StateSchema::check_update(const Value& update) const
{
    if (update.is_null())
    {
        return;
    }
    if (!update.is_object())
    {
        throw StepflowError(ErrorCode::InvalidInput,
            "Update must be an object of channel values, got " + std::string(update.type_name()));
    }
    for (const auto& item : update.items())
    {
        if (!has_channel(item.key()))
        {
            throw StepflowError(ErrorCode::InvalidInput,
                "Update writes undeclared channel '" + item.key() + "'");
        }
    }
}

RunState StateSchema::merge(const RunState& state, const std::vector<const Value*>& updates) const
{
    RunState merged = state;
    for (const auto& channel : m_channels)
    {
        auto current_it = merged.find(channel.name);
        Value current = current_it != merged.end() ? *current_it : channel.default_value;
        bool touched = false;

        for (const Value* update : updates)
        {
            if (update == nullptr || !update->is_object())
            {
                continue;
            }
            auto it = update->find(channel.name);
            if (it == update->end())
            {
                continue;
            }
            try
            {
                current = channel.reducer(current, *it);
            }
            catch (const std::exception& e)
            {
                throw ReducerConflictError(channel.name,
                    "Reducer for channel '" + channel.name + "' failed: " + e.what());
            }
            touched = true;
        }

        if (touched)
        {
            merged[channel.name] = std::move(current);
        }
    }
    return merged;
}

} // namespace stepflow
