/**
 * @file graph_validator.cpp
 */
#include "dagcheck/common/graph_validator.hpp"

#include <queue>

namespace dagcheck
{

namespace
{

void set_verdict(ValidationResult& result, Verdict verdict)
{
    result.verdict = verdict;
    result.is_dag = verdict_is_dag(verdict);
    result.message = verdict_message(verdict);
}

bool is_malformed_edge_issue(RecordIssueKind kind)
{
    return kind != RecordIssueKind::UnknownSource && kind != RecordIssueKind::UnknownTarget;
}

void push_unique(std::vector<size_t>& positions, size_t pos)
{
    // Issues for one record are adjacent
    if (positions.empty() || positions.back() != pos)
    {
        positions.push_back(pos);
    }
}

} // namespace

// ============================================================================
// Entry points
// ============================================================================

ValidationResult GraphValidator::validate(const nlohmann::json& nodes_raw,
                                          const nlohmann::json& edges_raw) const
{
    return validate(PipelineGraph::from_json(nodes_raw, edges_raw));
}

ValidationResult GraphValidator::validate(const PipelineGraph& graph) const
{
    ValidationResult result;
    result.num_nodes = graph.node_count();
    result.num_edges = graph.edge_count();

    // =========================================================================
    // Phase 1: Empty-input shortcuts
    // =========================================================================

    if (result.num_nodes == 0)
    {
        set_verdict(result, result.num_edges == 0 ? Verdict::Empty : Verdict::EdgesWithoutNodes);
        return result;
    }

    // =========================================================================
    // Phase 2: Record issues
    // =========================================================================

    std::vector<NodePos> malformed_nodes;
    std::vector<EdgePos> malformed_edges;
    std::vector<EdgePos> dangling_edges;

    for (const auto& issue : graph.issues())
    {
        if (issue.side == PipelineSide::Nodes)
        {
            push_unique(malformed_nodes, issue.position);
        }
        else if (is_malformed_edge_issue(issue.kind))
        {
            push_unique(malformed_edges, issue.position);
        }
        else
        {
            push_unique(dangling_edges, issue.position);
        }
    }

    if (!malformed_nodes.empty())
    {
        set_verdict(result, Verdict::MalformedNode);
        result.involved_nodes = std::move(malformed_nodes);
        return result;
    }
    if (!malformed_edges.empty())
    {
        set_verdict(result, Verdict::MalformedEdge);
        result.involved_edges = std::move(malformed_edges);
        return result;
    }
    if (!dangling_edges.empty())
    {
        set_verdict(result, Verdict::DanglingReference);
        result.involved_edges = std::move(dangling_edges);
        return result;
    }

    // =========================================================================
    // Phase 3: Acyclicity
    // =========================================================================

    if (result.num_edges == 0)
    {
        set_verdict(result, Verdict::IsolatedNodes);
        return result;
    }

    check_acyclic(graph, result);
    return result;
}

// ============================================================================
// Kahn's algorithm
// ============================================================================

void GraphValidator::check_acyclic(const PipelineGraph& graph, ValidationResult& result) const
{
    const size_t node_count = graph.node_count();

    std::vector<size_t> in_degree(node_count, 0);
    std::vector<std::vector<NodePos>> successors(node_count);

    for (const auto& [source, target] : graph.links())
    {
        successors[source].push_back(target);
        ++in_degree[target];
    }

    std::queue<NodePos> ready;
    for (NodePos n = 0; n < node_count; ++n)
    {
        if (in_degree[n] == 0)
        {
            ready.push(n);
        }
    }

    size_t processed = 0;
    while (!ready.empty())
    {
        NodePos n = ready.front();
        ready.pop();
        ++processed;

        for (NodePos succ : successors[n])
        {
            --in_degree[succ];
            if (in_degree[succ] == 0)
            {
                ready.push(succ);
            }
        }
    }

    if (processed == node_count)
    {
        set_verdict(result, Verdict::Valid);
        return;
    }

    set_verdict(result, Verdict::Cyclic);

    // Nodes on a cycle or downstream of one keep a positive in-degree
    for (NodePos n = 0; n < node_count; ++n)
    {
        if (in_degree[n] > 0)
        {
            result.involved_nodes.push_back(n);
        }
    }
}

} // namespace dagcheck
