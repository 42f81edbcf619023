#include "stepflow/common/graph_builder.hpp"
#include "stepflow/common/logging.hpp"

#include <algorithm>
#include <queue>
#include <sstream>
#include <unordered_set>

namespace stepflow
{

GraphBuilder::GraphBuilder(StateSchema schema, bool eager_validation)
    : m_eager_validation{eager_validation}
    , m_schema{std::make_shared<const StateSchema>(std::move(schema))}
{}

bool GraphBuilder::is_reserved(const std::string& name) const noexcept
{
    return name == kStart || name == kEnd;
}

bool GraphBuilder::has_node(const std::string& name) const noexcept
{
    return m_node_index.count(name) != 0;
}

void GraphBuilder::report(DiagnosticCategory category,
                          std::string message,
                          std::vector<std::string> nodes)
{
    if (m_eager_validation)
    {
        throw CompileError(message);
    }
    m_recorded.add(DiagnosticSeverity::Error, category, std::move(message), std::move(nodes));
}

void GraphBuilder::check_reference(const std::string& name, const char* role)
{
    if (!has_node(name))
    {
        report(DiagnosticCategory::UnknownNode,
               std::string(role) + " '" + name + "' is not a registered node", {name});
    }
}

GraphBuilder& GraphBuilder::add_node(const std::string& name, NodeFn fn)
{
    if (!fn)
    {
        throw CompileError("Node '" + name + "' has no function");
    }
    if (name.empty() || is_reserved(name))
    {
        report(DiagnosticCategory::InvalidName,
               "Invalid node name '" + name + "' (empty or reserved)", {name});
        return *this;
    }
    if (has_node(name))
    {
        report(DiagnosticCategory::DuplicateNode, "Duplicate node '" + name + "'", {name});
        return *this;
    }
    m_node_index.emplace(name, m_nodes.size());
    m_nodes.push_back(NodeEntry{name, std::move(fn)});
    return *this;
}

GraphBuilder& GraphBuilder::add_edge(const std::string& from, const std::string& to)
{
    if (from == kEnd || to == kStart || (from == kStart && to == kEnd))
    {
        report(DiagnosticCategory::InvalidName,
               "Invalid edge '" + from + "' -> '" + to + "'", {from, to});
        return *this;
    }
    if (m_eager_validation)
    {
        if (from != kStart)
        {
            check_reference(from, "Edge source");
        }
        if (to != kEnd)
        {
            check_reference(to, "Edge target");
        }
    }
    m_edges.emplace_back(from, to);
    return *this;
}

GraphBuilder& GraphBuilder::add_conditional_edge(const std::string& from,
                                                 RouterFn router,
                                                 std::vector<std::string> targets)
{
    if (!router)
    {
        throw CompileError("Conditional edge from '" + from + "' has no router");
    }
    if (m_eager_validation)
    {
        check_reference(from, "Router source");
        for (const auto& target : targets)
        {
            if (target != kEnd)
            {
                check_reference(target, "Router target");
            }
        }
        for (const auto& existing : m_routers)
        {
            if (existing.from == from)
            {
                report(DiagnosticCategory::DuplicateRouter,
                       "Node '" + from + "' already has a conditional edge", {from});
            }
        }
    }
    m_routers.push_back(RouterEntry{from, std::move(router), std::move(targets)});
    return *this;
}

std::shared_ptr<GraphDiagnostics> GraphBuilder::get_diagnostics() const
{
    auto diag = std::make_shared<GraphDiagnostics>(m_recorded);
    const auto error = DiagnosticSeverity::Error;

    // Start node
    std::vector<std::string> starts;
    for (const auto& edge : m_edges)
    {
        if (edge.first == kStart &&
            std::find(starts.begin(), starts.end(), edge.second) == starts.end())
        {
            starts.push_back(edge.second);
        }
    }
    if (starts.empty())
    {
        diag->add(error, DiagnosticCategory::MissingStart, "Graph has no start node");
    }
    else if (starts.size() > 1)
    {
        diag->add(error, DiagnosticCategory::MultipleStart,
                  "Graph has " + std::to_string(starts.size()) + " start nodes", starts);
    }

    // Unknown references
    for (const auto& edge : m_edges)
    {
        if (edge.first != kStart && !has_node(edge.first))
        {
            diag->add(error, DiagnosticCategory::UnknownNode,
                      "Edge source '" + edge.first + "' is not a registered node", {edge.first});
        }
        if (edge.second != kEnd && !has_node(edge.second))
        {
            diag->add(error, DiagnosticCategory::UnknownNode,
                      "Edge target '" + edge.second + "' is not a registered node", {edge.second});
        }
    }
    std::unordered_set<std::string> routed;
    for (const auto& entry : m_routers)
    {
        if (!has_node(entry.from))
        {
            diag->add(error, DiagnosticCategory::UnknownNode,
                      "Router source '" + entry.from + "' is not a registered node", {entry.from});
        }
        for (const auto& target : entry.targets)
        {
            if (target != kEnd && !has_node(target))
            {
                diag->add(error, DiagnosticCategory::UnknownNode,
                          "Router target '" + target + "' is not a registered node", {target});
            }
        }
        if (!routed.insert(entry.from).second)
        {
            diag->add(error, DiagnosticCategory::DuplicateRouter,
                      "Node '" + entry.from + "' has more than one conditional edge", {entry.from});
        }
    }

    // Adjacency over registered nodes
    const size_t n = m_nodes.size();
    std::vector<std::vector<size_t>> adjacency(n);
    std::vector<bool> has_exit(n, false);
    for (const auto& edge : m_edges)
    {
        auto from = m_node_index.find(edge.first);
        if (from == m_node_index.end())
        {
            continue;
        }
        has_exit[from->second] = true;
        auto to = m_node_index.find(edge.second);
        if (to != m_node_index.end())
        {
            adjacency[from->second].push_back(to->second);
        }
    }
    for (const auto& entry : m_routers)
    {
        auto from = m_node_index.find(entry.from);
        if (from == m_node_index.end())
        {
            continue;
        }
        has_exit[from->second] = true;
        if (entry.targets.empty())
        {
            // May route anywhere.
            for (size_t i = 0; i < n; ++i)
            {
                adjacency[from->second].push_back(i);
            }
            continue;
        }
        for (const auto& target : entry.targets)
        {
            auto to = m_node_index.find(target);
            if (to != m_node_index.end())
            {
                adjacency[from->second].push_back(to->second);
            }
        }
    }

    // Reachability from the start node
    if (starts.size() == 1 && has_node(starts.front()))
    {
        std::vector<bool> reached(n, false);
        std::queue<size_t> pending;
        size_t start = m_node_index.at(starts.front());
        reached[start] = true;
        pending.push(start);
        while (!pending.empty())
        {
            size_t current = pending.front();
            pending.pop();
            for (size_t next : adjacency[current])
            {
                if (!reached[next])
                {
                    reached[next] = true;
                    pending.push(next);
                }
            }
        }
        for (size_t i = 0; i < n; ++i)
        {
            if (!reached[i])
            {
                diag->add(error, DiagnosticCategory::UnreachableNode,
                          "Node '" + m_nodes[i].name + "' is unreachable from the start node",
                          {m_nodes[i].name});
            }
        }
    }

    for (size_t i = 0; i < n; ++i)
    {
        if (!has_exit[i])
        {
            diag->add(DiagnosticSeverity::Warning, DiagnosticCategory::DeadEnd,
                      "Node '" + m_nodes[i].name + "' has no outgoing edge and ends its branch",
                      {m_nodes[i].name});
        }
    }

    return diag;
}

std::shared_ptr<const CompiledGraph> GraphBuilder::build() const
{
    auto diagnostics = get_diagnostics();
    if (diagnostics->has_errors())
    {
        std::ostringstream oss;
        oss << "Graph validation failed with " << diagnostics->errors().size() << " error(s):\n";
        for (const auto& err : diagnostics->errors())
        {
            oss << "  - " << err.message << "\n";
        }
        throw CompileError(oss.str(), diagnostics);
    }
    for (const auto& warning : diagnostics->warnings())
    {
        logger()->warn("graph: {}", warning.message);
    }

    auto graph = std::make_shared<CompiledGraph>();
    const size_t n = m_nodes.size();

    graph->node_names.reserve(n);
    graph->node_fns.reserve(n);
    for (size_t i = 0; i < n; ++i)
    {
        graph->node_names.push_back(m_nodes[i].name);
        graph->node_fns.push_back(m_nodes[i].fn);
        graph->node_index.emplace(m_nodes[i].name, i);
    }

    graph->successors.resize(n);
    for (const auto& edge : m_edges)
    {
        if (edge.first == kStart)
        {
            graph->start_node = m_node_index.at(edge.second);
            continue;
        }
        if (edge.second == kEnd)
        {
            continue;
        }
        auto& list = graph->successors[m_node_index.at(edge.first)];
        size_t target = m_node_index.at(edge.second);
        if (std::find(list.begin(), list.end(), target) == list.end())
        {
            list.push_back(target);
        }
    }

    graph->routers.resize(n);
    graph->router_targets.resize(n);
    for (const auto& entry : m_routers)
    {
        size_t from = m_node_index.at(entry.from);
        graph->routers[from] = entry.router;
        graph->router_targets[from] = entry.targets;
    }

    graph->schema = m_schema;

    logger()->debug("graph: built {} node(s), start node '{}'",
                    n, graph->node_names[graph->start_node]);
    return graph;
}

} // namespace stepflow
