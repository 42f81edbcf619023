/**
 * @file graph_builder.hpp
 * @brief GraphBuilder collects named nodes and edges and compiles them.
 */
#pragma once
#include "stepflow/common/common.hpp"
#include "stepflow/common/errors.hpp"
#include "stepflow/common/graph_diagnostics.hpp"
#include "stepflow/common/graph_items.hpp"
#include "stepflow/execution/compiled_graph.hpp"

namespace stepflow
{

/**
 * @brief Builder for workflow graphs.
 *
 * @details
 * GraphBuilder records named nodes, static edges and conditional routers, and
 * produces an immutable CompiledGraph for the engine.
 *
 * @par Usage
 * 1. Create a GraphBuilder with a StateSchema.
 * 2. Add nodes via add_node().
 * 3. Connect kStart to the start node with add_edge().
 * 4. Add static edges (add_edge) and routers (add_conditional_edge).
 * 5. Call build() to validate and produce a CompiledGraph.
 *
 * @par Validation
 * With eager validation, naming errors and references to nodes that have
 * not been added yet throw CompileError from the mutating call. Otherwise all
 * problems are reported together by build(). Reachability and the start node
 * are always checked by build().
 *
 * @par Thread Safety
 * - No internal synchronization.
 * - Concurrent access requires external synchronization.
 */
class GraphBuilder
{
public:
    /**
     * @brief Construct a GraphBuilder.
     * @param schema The state channels available to the graph's nodes.
     * @param eager_validation If true, validate on each mutation.
     */
    explicit GraphBuilder(StateSchema schema, bool eager_validation = false);

    /**
     * @brief Register a node.
     * @param name Unique node name; must not be empty, kStart or kEnd.
     * @param fn The node body.
     * @throws CompileError if fn is empty, or on a naming error when eager.
     */
    GraphBuilder& add_node(const std::string& name, NodeFn fn);

    /**
     * @brief Add a static edge.
     * @param from Source node, or kStart to select the start node.
     * @param to Target node, or kEnd to end the branch.
     */
    GraphBuilder& add_edge(const std::string& from, const std::string& to);

    /**
     * @brief Attach a conditional router to a node.
     * @param from Source node.
     * @param router Function evaluated on the merged state after `from` ran.
     * @param targets Nodes the router may choose; empty means any node.
     * @throws CompileError if router is empty.
     */
    GraphBuilder& add_conditional_edge(const std::string& from,
                                       RouterFn router,
                                       std::vector<std::string> targets = {});

    /**
     * @brief Validate the graph and produce a CompiledGraph.
     *
     * @return Shared pointer to the immutable compiled graph.
     * @throws CompileError carrying the diagnostics if validation fails.
     */
    std::shared_ptr<const CompiledGraph> build() const;

    /**
     * @brief Get diagnostics without building.
     */
    std::shared_ptr<GraphDiagnostics> get_diagnostics() const;

    size_t node_count() const noexcept { return m_nodes.size(); }

private:
    struct NodeEntry
    {
        std::string name;
        NodeFn fn;
    };

    struct RouterEntry
    {
        std::string from;
        RouterFn router;
        std::vector<std::string> targets;
    };

    bool is_reserved(const std::string& name) const noexcept;
    bool has_node(const std::string& name) const noexcept;
    void report(DiagnosticCategory category, std::string message, std::vector<std::string> nodes);
    void check_reference(const std::string& name, const char* role);

    bool m_eager_validation{};
    std::shared_ptr<const StateSchema> m_schema;
    std::vector<NodeEntry> m_nodes;
    std::unordered_map<std::string, size_t> m_node_index;
    std::vector<std::pair<std::string, std::string>> m_edges;
    std::vector<RouterEntry> m_routers;

    /// Problems found while recording nodes and edges (deferred validation).
    GraphDiagnostics m_recorded;
};

} // namespace stepflow
