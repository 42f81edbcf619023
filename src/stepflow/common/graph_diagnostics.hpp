/**
 * @file graph_diagnostics.hpp
 */
#pragma once
#include "stepflow/common/common.hpp"

namespace stepflow
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Non-blocking issue that may indicate a problem.
    Error     ///< Blocking issue that prevents the graph from being built.
};

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    MissingStart,           ///< No edge leaves the start marker.
    MultipleStart,          ///< More than one edge leaves the start marker.
    InvalidName,            ///< Empty node name, or a reserved marker used as a node.
    DuplicateNode,          ///< Two nodes registered under the same name.
    UnknownNode,            ///< An edge or router target names no registered node.
    DuplicateRouter,        ///< More than one conditional edge from the same node.
    UnreachableNode,        ///< A node cannot be reached from the start node.
    DeadEnd                 ///< A node has no outgoing edge; it ends its branch.
};

/**
 * @brief A single diagnostic item (error or warning).
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    /// Node names involved in this issue (if applicable).
    std::vector<std::string> involved_nodes;
};

// ============================================================================
// GraphDiagnostics
// ============================================================================

/**
 * @brief Diagnostic information collected while building a graph.
 *
 * @details
 * `GraphDiagnostics` contains all errors and warnings detected for a graph
 * definition. It is produced by `GraphBuilder::get_diagnostics()` and attached
 * to the `CompileError` thrown by `GraphBuilder::build()`.
 *
 * @par Error vs Warning
 * - **Errors** prevent the graph from being built. Examples: MissingStart,
 *   DuplicateNode, UnknownNode, UnreachableNode.
 * - **Warnings** do not. Example: DeadEnd, a node without outgoing edges,
 *   which simply ends its branch.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class GraphDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    /**
     * @brief Check if the graph is valid for building.
     * @return True if there are no errors (warnings are allowed).
     */
    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Check whether any error of the given category is present.
     */
    bool has_error(DiagnosticCategory category) const noexcept
    {
        for (const auto& item : m_errors)
        {
            if (item.category == category)
            {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Get all diagnostic items (errors and warnings combined).
     * @return A vector containing all items, errors first then warnings.
     */
    std::vector<DiagnosticItem> all_items() const
    {
        std::vector<DiagnosticItem> result;
        result.reserve(m_errors.size() + m_warnings.size());
        result.insert(result.end(), m_errors.begin(), m_errors.end());
        result.insert(result.end(), m_warnings.begin(), m_warnings.end());
        return result;
    }

    // Allow GraphBuilder to populate diagnostics
    friend class GraphBuilder;

private:
    void add(DiagnosticSeverity severity,
             DiagnosticCategory category,
             std::string message,
             std::vector<std::string> involved_nodes = {})
    {
        DiagnosticItem item{severity, category, std::move(message), std::move(involved_nodes)};
        if (severity == DiagnosticSeverity::Error)
        {
            m_errors.push_back(std::move(item));
        }
        else
        {
            m_warnings.push_back(std::move(item));
        }
    }

    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace stepflow
