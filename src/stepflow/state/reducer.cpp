/**
 * @file reducer.cpp
 */
#include "stepflow/state/reducer.hpp"

namespace stepflow
{

namespace reducers
{

Reducer replace()
{
    return [](const Value& /*current*/, const Value& update) { return update; };
}

Reducer append()
{
    return [](const Value& current, const Value& update)
    {
        Value merged = current.is_null() ? Value::array() : current;
        if (!merged.is_array())
        {
            throw std::invalid_argument("append reducer: current value is not a list");
        }
        if (update.is_array())
        {
            merged.insert(merged.end(), update.begin(), update.end());
        }
        else
        {
            merged.push_back(update);
        }
        return merged;
    };
}

Reducer upsert_by_id(std::string id_key)
{
    return [id_key = std::move(id_key)](const Value& current, const Value& update)
    {
        std::map<Value, Value> by_id;

        auto absorb_item = [&](const Value& item)
        {
            if (!item.is_object())
            {
                throw std::invalid_argument("upsert reducer: item is not an object: " + item.dump());
            }
            auto id = item.find(id_key);
            if (id == item.end() || id->is_null())
            {
                throw std::invalid_argument(
                    "upsert reducer: item has no '" + id_key + "' field: " + item.dump());
            }
            by_id[*id] = item;
        };

        auto absorb = [&](const Value& list)
        {
            if (list.is_null())
            {
                return;
            }
            if (list.is_array())
            {
                for (const auto& item : list)
                {
                    absorb_item(item);
                }
                return;
            }
            absorb_item(list);
        };

        absorb(current);
        absorb(update);

        Value merged = Value::array();
        for (auto& entry : by_id)
        {
            merged.push_back(std::move(entry.second));
        }
        return merged;
    };
}

} // namespace reducers

} // namespace stepflow
