/**
 * @file pipeline_graph_tests.cpp
 * @brief Unit tests for PipelineGraph, make_node_key() and decode_pipeline_field()
 */
#include <gtest/gtest.h>
#include "dagcheck/common/pipeline_decoder.hpp"
#include "dagcheck/common/pipeline_graph.hpp"

using namespace dagcheck;
using nlohmann::json;

// ============================================================================
// Identifier keys
// ============================================================================

TEST(NodeKeyTests, Scalars_AreValidIdentifiers)
{
    EXPECT_TRUE(make_node_key(json("A")).has_value());
    EXPECT_TRUE(make_node_key(json(7)).has_value());
    EXPECT_TRUE(make_node_key(json(2.5)).has_value());
    EXPECT_TRUE(make_node_key(json(true)).has_value());
    EXPECT_TRUE(make_node_key(json(nullptr)).has_value());
}

TEST(NodeKeyTests, Containers_AreRejected)
{
    EXPECT_FALSE(make_node_key(json::array({1, 2})).has_value());
    EXPECT_FALSE(make_node_key(json::object({{"a", 1}})).has_value());
}

TEST(NodeKeyTests, Numbers_CompareByValue)
{
    EXPECT_EQ(make_node_key(json::parse("1")), make_node_key(json::parse("1.0")));
    EXPECT_EQ(make_node_key(json::parse("-3")), make_node_key(json::parse("-3.0")));
    EXPECT_NE(make_node_key(json::parse("1")), make_node_key(json::parse("1.5")));
}

TEST(NodeKeyTests, BooleansAndNumbers_Differ)
{
    EXPECT_NE(make_node_key(json(true)), make_node_key(json(1)));
    EXPECT_NE(make_node_key(json(false)), make_node_key(json(0)));
    EXPECT_NE(make_node_key(json(true)), make_node_key(json(1.0)));
}

TEST(NodeKeyTests, UnsignedAboveInt64_DiffersFromEqualFloat)
{
    auto big_unsigned = json::parse("9223372036854775808");
    auto big_float = json::parse("9223372036854775808.0");
    ASSERT_TRUE(big_unsigned.is_number_unsigned());
    ASSERT_TRUE(big_float.is_number_float());
    EXPECT_NE(make_node_key(big_unsigned), make_node_key(big_float));
}

TEST(NodeKeyTests, StringsAndNumbers_Differ)
{
    EXPECT_NE(make_node_key(json("1")), make_node_key(json(1)));
    EXPECT_NE(make_node_key(json("true")), make_node_key(json(true)));
    EXPECT_NE(make_node_key(json("null")), make_node_key(json(nullptr)));
}

// ============================================================================
// PipelineGraph
// ============================================================================

TEST(PipelineGraphTests, Links_ResolveToNodePositions)
{
    auto graph = PipelineGraph::from_json(
        json::parse(R"([{"id": "A"}, {"id": "B"}, {"id": "C"}])"),
        json::parse(R"([{"source": "C", "target": "A"}, {"source": "A", "target": "B"}])"));

    EXPECT_EQ(graph.node_count(), 3u);
    EXPECT_EQ(graph.edge_count(), 2u);
    EXPECT_TRUE(graph.issues().empty());
    ASSERT_EQ(graph.links().size(), 2u);
    EXPECT_EQ(graph.links()[0], EdgeLinkPair(2, 0));
    EXPECT_EQ(graph.links()[1], EdgeLinkPair(0, 1));
    EXPECT_EQ(graph.link_positions(), (std::vector<EdgePos>{0, 1}));
}

TEST(PipelineGraphTests, FindNode_UsesFirstDeclaration)
{
    auto graph = PipelineGraph::from_json(
        json::parse(R"([{"id": "X"}, {"id": "Y"}, {"id": "X"}])"), json::parse("[]"));
    auto key = make_node_key(json("X"));
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(graph.find_node(*key), std::optional<NodePos>(0));
    EXPECT_FALSE(graph.find_node("\"Z\"").has_value());
}

TEST(PipelineGraphTests, Issues_RecordKindAndPosition)
{
    auto graph = PipelineGraph::from_json(
        json::parse(R"([{"id": "A"}, "B", {"label": "C"}, {"id": [1]}])"),
        json::parse(R"([{"source": "A"}, {"target": "A"}, {"source": "A", "target": "Q"},
                        {"source": {}, "target": "A"}, null])"));

    const auto& issues = graph.issues();
    ASSERT_EQ(issues.size(), 8u);

    EXPECT_EQ(issues[0].side, PipelineSide::Nodes);
    EXPECT_EQ(issues[0].position, 1u);
    EXPECT_EQ(issues[0].kind, RecordIssueKind::NotAnObject);

    EXPECT_EQ(issues[1].position, 2u);
    EXPECT_EQ(issues[1].kind, RecordIssueKind::MissingId);

    EXPECT_EQ(issues[2].position, 3u);
    EXPECT_EQ(issues[2].kind, RecordIssueKind::InvalidId);

    EXPECT_EQ(issues[3].side, PipelineSide::Edges);
    EXPECT_EQ(issues[3].position, 0u);
    EXPECT_EQ(issues[3].kind, RecordIssueKind::MissingTarget);

    EXPECT_EQ(issues[4].position, 1u);
    EXPECT_EQ(issues[4].kind, RecordIssueKind::MissingSource);

    EXPECT_EQ(issues[5].position, 2u);
    EXPECT_EQ(issues[5].kind, RecordIssueKind::UnknownTarget);
    EXPECT_EQ(issues[5].message, "Edge 2 target \"Q\" is not a declared node");

    EXPECT_EQ(issues[6].position, 3u);
    EXPECT_EQ(issues[6].kind, RecordIssueKind::InvalidEndpoint);

    EXPECT_EQ(issues[7].position, 4u);
    EXPECT_EQ(issues[7].kind, RecordIssueKind::NotAnObject);

    EXPECT_TRUE(graph.links().empty());
}

TEST(PipelineGraphTests, Issues_NullEdgeIsNotAnObject)
{
    auto graph = PipelineGraph::from_json(json::parse(R"([{"id": "A"}])"), json::parse("[null]"));
    ASSERT_EQ(graph.issues().size(), 1u);
    EXPECT_EQ(graph.issues()[0].kind, RecordIssueKind::NotAnObject);
}

TEST(PipelineGraphTests, Shape_NonArrayThrows)
{
    EXPECT_THROW(PipelineGraph::from_json(json::object(), json::array()), PipelineError);
    EXPECT_THROW(PipelineGraph::from_json(json::array(), json(5)), PipelineError);
}

// ============================================================================
// Decoding
// ============================================================================

TEST(PipelineDecoderTests, Decode_ValidList)
{
    auto value = decode_pipeline_field(R"([{"id": "A"}])", PipelineSide::Nodes);
    ASSERT_TRUE(value.is_array());
    EXPECT_EQ(value.size(), 1u);
}

TEST(PipelineDecoderTests, Decode_NonListStillDecodes)
{
    auto value = decode_pipeline_field("{\"id\": 1}", PipelineSide::Nodes);
    EXPECT_TRUE(value.is_object());
}

TEST(PipelineDecoderTests, Decode_InvalidJsonNamesTheField)
{
    try
    {
        decode_pipeline_field("[{\"id\": ", PipelineSide::Edges);
        FAIL() << "Expected PipelineError";
    }
    catch (const PipelineError& e)
    {
        EXPECT_EQ(e.code(), PipelineErrorCode::DecodeError);
        std::string message = e.what();
        EXPECT_EQ(message.rfind("Invalid JSON in edges: ", 0), 0u) << message;
        EXPECT_NE(message.find("parse error"), std::string::npos) << message;
    }
}

TEST(PipelineDecoderTests, Decode_ErrorIsARuntimeError)
{
    try
    {
        decode_pipeline_field("nope", PipelineSide::Nodes);
        FAIL() << "Expected PipelineError";
    }
    catch (const std::runtime_error& e)
    {
        auto* pipeline_error = dynamic_cast<const PipelineError*>(&e);
        ASSERT_NE(pipeline_error, nullptr);
        EXPECT_STREQ(to_string(pipeline_error->code()), "DecodeError");
    }
}

TEST(PipelineDecoderTests, Decode_EmptyTextIsAnError)
{
    EXPECT_THROW(decode_pipeline_field("", PipelineSide::Nodes), PipelineError);
}
