/**
 * @file pipeline_graph.cpp
 */
#include "dagcheck/common/pipeline_graph.hpp"

#include <cmath>
#include <limits>

namespace dagcheck
{

namespace
{

std::string position_label(PipelineSide side, size_t position)
{
    return std::string(side == PipelineSide::Nodes ? "Node" : "Edge") + " " +
           std::to_string(position);
}

} // namespace

// ============================================================================
// Identifier keys
// ============================================================================

std::optional<NodeKey> make_node_key(const nlohmann::json& value)
{
    switch (value.type())
    {
    case nlohmann::json::value_t::string:
    case nlohmann::json::value_t::boolean:
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
        return value.dump();
    case nlohmann::json::value_t::number_float:
    {
        // Integral floats share the key of the equal integer
        double d = value.get<double>();
        if (std::isfinite(d) && std::trunc(d) == d &&
            d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
            d < static_cast<double>(std::numeric_limits<int64_t>::max()))
        {
            return std::to_string(static_cast<int64_t>(d));
        }
        return value.dump();
    }
    default:
        return std::nullopt;
    }
}

// ============================================================================
// Construction
// ============================================================================

PipelineGraph PipelineGraph::from_json(const nlohmann::json& nodes_raw, const nlohmann::json& edges_raw)
{
    if (!nodes_raw.is_array())
    {
        throw PipelineError(PipelineErrorCode::ShapeError, "Nodes data must be a list");
    }
    if (!edges_raw.is_array())
    {
        throw PipelineError(PipelineErrorCode::ShapeError, "Edges data must be a list");
    }

    PipelineGraph graph;
    graph.add_nodes(nodes_raw);
    graph.add_edges(edges_raw);
    return graph;
}

void PipelineGraph::add_nodes(const nlohmann::json& nodes_raw)
{
    m_node_count = nodes_raw.size();
    m_node_index.reserve(m_node_count);

    for (NodePos pos = 0; pos < m_node_count; ++pos)
    {
        const auto& node = nodes_raw[pos];
        if (!node.is_object())
        {
            m_issues.push_back({PipelineSide::Nodes, pos, RecordIssueKind::NotAnObject,
                                position_label(PipelineSide::Nodes, pos) + " is not an object"});
            continue;
        }

        auto it = node.find("id");
        if (it == node.end())
        {
            m_issues.push_back({PipelineSide::Nodes, pos, RecordIssueKind::MissingId,
                                position_label(PipelineSide::Nodes, pos) + " has no 'id'"});
            continue;
        }

        auto key = make_node_key(*it);
        if (!key)
        {
            m_issues.push_back({PipelineSide::Nodes, pos, RecordIssueKind::InvalidId,
                                position_label(PipelineSide::Nodes, pos) +
                                    " has an 'id' that is an object or array"});
            continue;
        }

        // First declaration wins
        m_node_index.emplace(std::move(*key), pos);
    }
}

void PipelineGraph::add_edges(const nlohmann::json& edges_raw)
{
    m_edge_count = edges_raw.size();
    m_links.reserve(m_edge_count);
    m_link_positions.reserve(m_edge_count);

    for (EdgePos pos = 0; pos < m_edge_count; ++pos)
    {
        const auto& edge = edges_raw[pos];
        if (!edge.is_object())
        {
            m_issues.push_back({PipelineSide::Edges, pos, RecordIssueKind::NotAnObject,
                                position_label(PipelineSide::Edges, pos) + " is not an object"});
            continue;
        }

        auto source = resolve_endpoint(edge, pos, "source", RecordIssueKind::MissingSource,
                                       RecordIssueKind::UnknownSource);
        auto target = resolve_endpoint(edge, pos, "target", RecordIssueKind::MissingTarget,
                                       RecordIssueKind::UnknownTarget);
        if (source && target)
        {
            m_links.emplace_back(*source, *target);
            m_link_positions.push_back(pos);
        }
    }
}

std::optional<NodePos> PipelineGraph::resolve_endpoint(const nlohmann::json& edge, EdgePos pos,
                                                       const char* field_name,
                                                       RecordIssueKind missing_kind,
                                                       RecordIssueKind unknown_kind)
{
    const std::string label = position_label(PipelineSide::Edges, pos);

    auto it = edge.find(field_name);
    if (it == edge.end())
    {
        m_issues.push_back({PipelineSide::Edges, pos, missing_kind,
                            label + " has no '" + field_name + "'"});
        return std::nullopt;
    }

    auto key = make_node_key(*it);
    if (!key)
    {
        m_issues.push_back({PipelineSide::Edges, pos, RecordIssueKind::InvalidEndpoint,
                            label + " has a '" + field_name + "' that is an object or array"});
        return std::nullopt;
    }

    auto node_pos = find_node(*key);
    if (!node_pos)
    {
        m_issues.push_back({PipelineSide::Edges, pos, unknown_kind,
                            label + " " + field_name + " " + *key + " is not a declared node"});
        return std::nullopt;
    }
    return node_pos;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<NodePos> PipelineGraph::find_node(const NodeKey& key) const
{
    auto it = m_node_index.find(key);
    if (it == m_node_index.end())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace dagcheck
