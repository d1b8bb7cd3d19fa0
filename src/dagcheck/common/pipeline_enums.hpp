/**
 * @file pipeline_enums.hpp
 */
#pragma once
#include "dagcheck/common/common.hpp"

namespace dagcheck
{

// ============================================================================
// Position type aliases
// ============================================================================

/**
 * @brief Type alias for node positions.
 *
 * @details
 * `NodePos` is the zero-based position of a node record in the submitted node
 * list. This alias exists for clarity in API signatures and documentation, not
 * for compile-time type safety.
 */
using NodePos = size_t;

/**
 * @brief Type alias for edge positions.
 *
 * @details
 * `EdgePos` is the zero-based position of an edge record in the submitted edge
 * list. This alias exists for clarity in API signatures and documentation, not
 * for compile-time type safety.
 */
using EdgePos = size_t;

/**
 * @brief Canonical text form of a node identifier.
 *
 * @details
 * Identifiers arrive as JSON scalars. Two identifiers are equal if and only if
 * their `NodeKey` strings are equal; see `make_node_key()`.
 */
using NodeKey = std::string;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Which of the two submitted lists a message or error refers to.
 */
enum class PipelineSide
{
    Nodes,
    Edges
};

/**
 * @brief Classification of a validation result.
 *
 * @details
 * Every `ValidationResult` carries exactly one verdict. Structural problems in
 * individual records are reported here instead of being thrown, so a request
 * with malformed records still produces a normal result.
 *
 * @par Precedence
 * When several problems are present, the first applicable verdict in this
 * order wins: `MalformedNode`, `MalformedEdge`, `DanglingReference`, then the
 * acyclicity verdicts.
 */
enum class Verdict
{
    Empty,              ///< No nodes and no edges.
    EdgesWithoutNodes,  ///< Edges were given but the node list is empty.
    MalformedNode,      ///< A node is not an object or lacks a usable `id`.
    MalformedEdge,      ///< An edge is not an object or lacks `source`/`target`.
    DanglingReference,  ///< An edge endpoint names no declared node.
    IsolatedNodes,      ///< Nodes but no edges.
    Cyclic,             ///< Kahn's algorithm left unprocessed nodes.
    Valid               ///< Acyclic with at least one edge.
};

/**
 * @brief Kind of problem found in a single node or edge record.
 */
enum class RecordIssueKind
{
    NotAnObject,
    MissingId,
    InvalidId,
    MissingSource,
    MissingTarget,
    InvalidEndpoint,
    UnknownSource,
    UnknownTarget
};

/**
 * @brief Get the display name of a side ("nodes" or "edges").
 */
inline const char* to_string(PipelineSide side) noexcept
{
    return side == PipelineSide::Nodes ? "nodes" : "edges";
}

/**
 * @brief Get the display name of a verdict.
 */
inline const char* to_string(Verdict verdict) noexcept
{
    switch (verdict)
    {
    case Verdict::Empty:
        return "Empty";
    case Verdict::EdgesWithoutNodes:
        return "EdgesWithoutNodes";
    case Verdict::MalformedNode:
        return "MalformedNode";
    case Verdict::MalformedEdge:
        return "MalformedEdge";
    case Verdict::DanglingReference:
        return "DanglingReference";
    case Verdict::IsolatedNodes:
        return "IsolatedNodes";
    case Verdict::Cyclic:
        return "Cyclic";
    case Verdict::Valid:
        return "Valid";
    }
    return "Unknown";
}

} // namespace dagcheck
