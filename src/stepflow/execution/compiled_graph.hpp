/**
 * @file compiled_graph.hpp
 * @brief Definition of the immutable CompiledGraph produced by GraphBuilder.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/graph_items.hpp"
#include "stepflow/state/state_schema.hpp"

namespace stepflow
{

/**
 * @brief Immutable, validated graph produced by GraphBuilder::build().
 *
 * @details
 * CompiledGraph contains everything the engine needs to run a thread:
 * - Node names and bodies, indexed by node index
 * - Static successors (edges to kEnd are not listed)
 * - Optional conditional router per node, with its declared targets
 * - The start node and the state schema
 *
 * @par Thread Safety
 * - Once constructed, the structure is immutable.
 * - Concurrent runs on different thread ids may share one instance.
 */
struct CompiledGraph
{
    /**
     * @brief Node names indexed by node index, in registration order.
     */
    std::vector<std::string> node_names;

    /**
     * @brief Node bodies indexed by node index.
     */
    std::vector<NodeFn> node_fns;

    /**
     * @brief Static successors of each node, as node indices.
     */
    std::vector<std::vector<size_t>> successors;

    /**
     * @brief Conditional router of each node; empty when the node has none.
     */
    std::vector<RouterFn> routers;

    /**
     * @brief Declared targets of each router.
     *
     * @details
     * An empty list means the router may name any node. Otherwise the router's
     * Next and FanOut targets must be in this list (kEnd is always allowed).
     */
    std::vector<std::vector<std::string>> router_targets;

    /**
     * @brief Index of the start node.
     */
    size_t start_node{0};

    std::shared_ptr<const StateSchema> schema;

    std::unordered_map<std::string, size_t> node_index;

    /**
     * @brief Look up a node index by name.
     * @return The index, or std::nullopt if no such node exists.
     */
    std::optional<size_t> find_node(const std::string& name) const
    {
        auto it = node_index.find(name);
        if (it == node_index.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief The task scheduled when a run starts.
     */
    Task start_task() const
    {
        return Task{node_names[start_node], Value{}, false};
    }

    size_t node_count() const noexcept
    {
        return node_names.size();
    }
};

} // namespace stepflow
