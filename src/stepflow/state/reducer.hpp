/**
 * @file reducer.hpp
 * @brief Reducer type and the built-in reducer kinds.
 */
#pragma once
#include "stepflow/common/common.hpp"

namespace stepflow
{

/**
 * @brief A pure function combining a channel's current value with one update.
 *
 * @details
 * Reducers are applied at superstep boundaries only, once per update written
 * to the channel during the superstep. A reducer reports a malformed update
 * by throwing; the engine turns that into a ReducerConflictError and aborts
 * the superstep.
 *
 * Any channel that may be written by more than one task in the same superstep
 * must use a reducer whose result does not depend on the order of those
 * updates. The engine applies them in task-index order, so a reducer that is
 * not order-independent is still deterministic, but not commutative.
 */
using Reducer = std::function<Value(const Value& current, const Value& update)>;

namespace reducers
{

/**
 * @brief Last write wins.
 * @details With several writers in one superstep, the task with the highest
 *          frontier index wins.
 */
Reducer replace();

/**
 * @brief Concatenate onto a list.
 * @details A null current value is treated as an empty list. An array update
 *          is concatenated; any other update is appended as one element.
 *          The order of elements written in one superstep follows task index.
 */
Reducer append();

/**
 * @brief Upsert objects into a list keyed by an identifier field.
 *
 * @details
 * Both the current value and the update may be a list of objects, a single
 * object, or null. Items are indexed by `item[id_key]`; items from the update
 * replace current items with the same id. The result is flattened in
 * ascending id order, so merging a set of updates with distinct ids yields the
 * same list in any application order.
 *
 * Two updates carrying the same id in one superstep resolve to the one applied
 * last; fields are not merged.
 *
 * @throws std::invalid_argument (from the returned reducer) if an item is not
 *         an object or has no id.
 */
Reducer upsert_by_id(std::string id_key = "id");

} // namespace reducers

} // namespace stepflow
