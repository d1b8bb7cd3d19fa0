/**
 * @file validation_result.hpp
 * @brief Definition of ValidationResult returned by GraphValidator::validate().
 */
#pragma once
#include "dagcheck/common/common.hpp"
#include "dagcheck/common/pipeline_enums.hpp"

#include <algorithm>

namespace dagcheck
{

/**
 * @brief Get the client-facing message for a verdict.
 */
inline const char* verdict_message(Verdict verdict) noexcept
{
    switch (verdict)
    {
    case Verdict::Empty:
        return "Empty pipeline - no nodes or edges";
    case Verdict::EdgesWithoutNodes:
        return "Invalid pipeline - edges exist without nodes";
    case Verdict::MalformedNode:
        return "Invalid pipeline - every node must be an object with an 'id'";
    case Verdict::MalformedEdge:
        return "Invalid pipeline - every edge must be an object with 'source' and 'target'";
    case Verdict::DanglingReference:
        return "Invalid pipeline - edge references an unknown node";
    case Verdict::IsolatedNodes:
        return "Pipeline contains only isolated nodes";
    case Verdict::Cyclic:
        return "Pipeline contains cycles and is not a valid DAG";
    case Verdict::Valid:
        return "Valid pipeline structure";
    }
    return "Unknown verdict";
}

/**
 * @brief Whether a verdict describes a valid DAG.
 * @details Empty pipelines and pipelines with only isolated nodes are DAGs.
 */
inline bool verdict_is_dag(Verdict verdict) noexcept
{
    return verdict == Verdict::Empty || verdict == Verdict::IsolatedNodes ||
           verdict == Verdict::Valid;
}

/**
 * @brief Result of validating one pipeline.
 *
 * @details
 * ValidationResult captures:
 * - The number of submitted node and edge records
 * - Whether the pipeline is a DAG
 * - The verdict and its client-facing message
 * - Which records the verdict is about (for logging)
 *
 * Only the counts, `is_dag` and `message` are sent to the client.
 */
struct ValidationResult
{
    size_t num_nodes{0};

    size_t num_edges{0};

    bool is_dag{true};

    Verdict verdict{Verdict::Empty};

    std::string message;

    /**
     * @brief Node positions involved in the verdict.
     * @details Malformed nodes for `MalformedNode`; nodes left with a
     *          positive in-degree for `Cyclic`. Empty otherwise.
     */
    std::vector<NodePos> involved_nodes;

    /**
     * @brief Edge positions involved in the verdict.
     * @details Offending edges for `MalformedEdge` and `DanglingReference`.
     */
    std::vector<EdgePos> involved_edges;

    /**
     * @brief Get a summary string for logging.
     *
     * @details
     * Involved positions are listed, e.g. `involved_nodes=[0, 2]`. Lists
     * longer than `k_summary_max_positions` end with `...`.
     */
    std::string summary() const
    {
        std::string result = to_string(verdict);
        result += " (nodes=" + std::to_string(num_nodes);
        result += ", edges=" + std::to_string(num_edges);
        result += ", is_dag=" + std::string(is_dag ? "true" : "false");
        if (!involved_nodes.empty())
        {
            result += ", involved_nodes=" + format_positions(involved_nodes);
        }
        if (!involved_edges.empty())
        {
            result += ", involved_edges=" + format_positions(involved_edges);
        }
        result += ")";
        return result;
    }

    static constexpr size_t k_summary_max_positions = 10;

private:
    static std::string format_positions(const std::vector<size_t>& positions)
    {
        std::string out = "[";
        size_t shown = std::min(positions.size(), k_summary_max_positions);
        for (size_t i = 0; i < shown; ++i)
        {
            if (i > 0)
            {
                out += ", ";
            }
            out += std::to_string(positions[i]);
        }
        if (positions.size() > shown)
        {
            out += ", ...";
        }
        out += "]";
        return out;
    }
};

} // namespace dagcheck
