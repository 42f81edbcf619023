/**
 * @file graph_items.hpp
 * @brief Node, task and routing types shared by the builder and the engine.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/state/state_schema.hpp"

namespace stepflow
{

class NodeContext;

/**
 * @brief Marker naming the graph entry. `add_edge(kStart, node)` selects the
 * start node.
 */
inline constexpr const char* kStart = "__start__";

/**
 * @brief Marker naming the terminal sentinel. An edge or route to `kEnd`
 * ends the branch.
 */
inline constexpr const char* kEnd = "__end__";

/**
 * @brief A scheduled node invocation.
 *
 * @details
 * Ordinary edges produce one task per target node with no input. A FanOut
 * route produces one task per entry, each carrying its own input override.
 */
struct Task
{
    std::string node;

    /// Input override; only meaningful when `has_input` is true.
    Value input{};

    bool has_input{false};
};

/**
 * @brief Create a fan-out task for `node` with its own input.
 */
inline Task send(std::string node, Value input)
{
    return Task{std::move(node), std::move(input), true};
}

// ============================================================================
// Routing
// ============================================================================

/// Continue with one node (or end the branch when the node is kEnd).
struct Next
{
    std::string node;
};

/// Spawn one task per entry, possibly many for the same node.
struct FanOut
{
    std::vector<Task> tasks;
};

/// End this branch.
struct Halt
{
};

/**
 * @brief Decision returned by a conditional router.
 */
using RouteDecision = std::variant<Next, FanOut, Halt>;

// ============================================================================
// Node results
// ============================================================================

/**
 * @brief Partial state update: a JSON object mapping channel name to the
 * value handed to that channel's reducer. Null means "no writes".
 */
using Update = Value;

/**
 * @brief Raised by a node that needs external input before it can finish.
 *
 * @details
 * An empty id is replaced by the engine with a deterministic identifier
 * derived from the thread, superstep, node and interrupt ordinal.
 */
struct InterruptSignal
{
    std::string id;
    Value payload;
};

/**
 * @brief Failure reported by a node without throwing.
 */
struct NodeError
{
    std::string message;
};

/**
 * @brief Outcome of one node invocation.
 */
using NodeResult = std::variant<Update, InterruptSignal, NodeError>;

/**
 * @brief Node body.
 *
 * @details
 * Receives a read-only view of the run state and its task input through the
 * NodeContext. Must not touch any shared data other than what it returns.
 * Exceptions thrown from the body are reported as node failures.
 */
using NodeFn = std::function<NodeResult(NodeContext&)>;

/**
 * @brief Conditional router, evaluated against the merged state after the
 * superstep that ran its source node.
 */
using RouterFn = std::function<RouteDecision(const RunState&)>;

} // namespace stepflow
