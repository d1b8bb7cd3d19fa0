/**
 * @file pipeline_graph.hpp
 * @brief Typed boundary model built from the untyped node and edge lists.
 */
#pragma once
#include "dagcheck/common/common.hpp"
#include "dagcheck/common/pipeline_enums.hpp"
#include "dagcheck/common/pipeline_exceptions.hpp"

#include <nlohmann/json.hpp>

namespace dagcheck
{

// ============================================================================
// Record types
// ============================================================================

/**
 * @brief A resolved dependency between two nodes, as (source, target).
 * @details Both members are node positions in the submitted node list.
 */
using EdgeLinkPair = std::pair<NodePos, NodePos>;

/**
 * @brief A problem found in a single node or edge record.
 */
struct RecordIssue
{
    PipelineSide side;
    size_t position;
    RecordIssueKind kind;
    std::string message;
};

/**
 * @brief Compute the canonical key of a JSON identifier.
 *
 * @details
 * Strings, numbers, booleans and null are valid identifiers. Numbers compare
 * by value, so `1` and `1.0` map to the same key, while `"1"` (a string) maps
 * to a different key than `1` (a number).
 *
 * Two cases do not compare equal:
 * - Booleans are not numbers: `true` never matches `1`, nor `false` `0`.
 * - Float equality with integers is limited to the `int64_t` range. An
 *   unsigned id above `INT64_MAX` (e.g. `9223372036854775808`) does not match
 *   the float of the same value (`9223372036854775808.0`).
 *
 * @param value The JSON value used as `id`, `source` or `target`.
 * @return The key, or `std::nullopt` if the value is an object or array.
 */
std::optional<NodeKey> make_node_key(const nlohmann::json& value);

// ============================================================================
// PipelineGraph
// ============================================================================

/**
 * @brief The node and edge lists of one request, checked for shape.
 *
 * @details
 * `PipelineGraph` converts the two decoded JSON values into typed records.
 * It is the only place where raw JSON is inspected; `GraphValidator` works on
 * the result.
 *
 * @par Shape errors vs record issues
 * - If either value is not a JSON array, `from_json()` throws `PipelineError`
 *   with `ShapeError`. Nodes are checked before edges.
 * - Problems in individual records are collected in `issues()` and never
 *   thrown.
 *
 * @par Identifier resolution
 * Node ids are assumed to be unique. If an id is declared more than once,
 * edges resolve to its first declaration.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class PipelineGraph
{
public:
    /**
     * @brief Build a PipelineGraph from decoded JSON values.
     * @param nodes_raw Decoded value of the `nodes` field.
     * @param edges_raw Decoded value of the `edges` field.
     * @throw PipelineError with `ShapeError` if either value is not an array.
     */
    static PipelineGraph from_json(const nlohmann::json& nodes_raw, const nlohmann::json& edges_raw);

    /**
     * @brief Number of node records submitted, including malformed ones.
     */
    size_t node_count() const noexcept
    {
        return m_node_count;
    }

    /**
     * @brief Number of edge records submitted, including malformed ones.
     */
    size_t edge_count() const noexcept
    {
        return m_edge_count;
    }

    /**
     * @brief Edges whose endpoints both resolved to declared nodes.
     * @details Kept in submission order. Parallel edges and self-loops are
     *          preserved.
     */
    const std::vector<EdgeLinkPair>& links() const noexcept
    {
        return m_links;
    }

    /**
     * @brief Positions (in the edge list) of the entries of `links()`.
     */
    const std::vector<EdgePos>& link_positions() const noexcept
    {
        return m_link_positions;
    }

    /**
     * @brief All record issues, node issues first.
     */
    const std::vector<RecordIssue>& issues() const noexcept
    {
        return m_issues;
    }

    /**
     * @brief Look up the position of the node declaring the given key.
     * @return The first declaring position, or `std::nullopt`.
     */
    std::optional<NodePos> find_node(const NodeKey& key) const;

private:
    PipelineGraph() = default;

    void add_nodes(const nlohmann::json& nodes_raw);
    void add_edges(const nlohmann::json& edges_raw);

    /// Resolve one endpoint of an edge, recording issues as needed.
    std::optional<NodePos> resolve_endpoint(const nlohmann::json& edge, EdgePos pos,
                                            const char* field_name,
                                            RecordIssueKind missing_kind,
                                            RecordIssueKind unknown_kind);

    size_t m_node_count = 0;
    size_t m_edge_count = 0;

    /// First declaring node position for each identifier.
    std::unordered_map<NodeKey, NodePos> m_node_index;

    std::vector<EdgeLinkPair> m_links;
    std::vector<EdgePos> m_link_positions;
    std::vector<RecordIssue> m_issues;
};

} // namespace dagcheck
