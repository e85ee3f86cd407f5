/**
 * @file tree_parser_tests.cpp
 * Unit tests for cratescope::TreeParser
 */
#include <gtest/gtest.h>
#include "cratescope/parser/tree_parser.hpp"

#include <string>

using namespace cratescope;

namespace
{

NodeIdx find_node(const CrateGraph& graph, const std::string& full_name)
{
    for (NodeIdx idx : graph.node_indices())
    {
        if (graph.node_weight(idx).full() == full_name)
        {
            return idx;
        }
    }
    ADD_FAILURE() << "no node named '" << full_name << "'";
    return 0;
}

size_t error_line(std::string_view listing)
{
    try
    {
        TreeParser().parse(listing);
    }
    catch (const TreeParseError& e)
    {
        EXPECT_EQ(e.code(), CrateGraphErrorCode::MalformedInput);
        return e.line_number();
    }
    ADD_FAILURE() << "expected TreeParseError";
    return 0;
}

} // namespace

// ============================================================================
// Plain dependency trees
// ============================================================================

TEST(TreeParserTests, Parse_SingleRoot)
{
    CrateGraph graph = TreeParser().parse("0app v0.1.0\n");
    EXPECT_EQ(graph.node_count(), 1u);
    EXPECT_EQ(graph.edge_count(), 0u);
    EXPECT_EQ(graph.node_weight(graph.root()).full(), "app v0.1.0");
}

TEST(TreeParserTests, Parse_BackReferenceReusesNode)
{
    CrateGraph graph = TreeParser().parse("0root v0.1.0\n"
                                          "1a v1.0.0\n"
                                          "2b v1.0.0\n"
                                          "1b v1.0.0 (*)\n");
    ASSERT_EQ(graph.node_count(), 3u);
    NodeIdx root = find_node(graph, "root v0.1.0");
    NodeIdx a = find_node(graph, "a v1.0.0");
    NodeIdx b = find_node(graph, "b v1.0.0");

    EXPECT_EQ(graph.root(), root);
    EXPECT_EQ(graph.edge_count(), 3u);
    EXPECT_NE(graph.find_edge(root, a), nullptr);
    EXPECT_NE(graph.find_edge(a, b), nullptr);
    EXPECT_NE(graph.find_edge(root, b), nullptr);
}

TEST(TreeParserTests, Parse_ReturnToAncestorDepth)
{
    CrateGraph graph = TreeParser().parse("0root v0.1.0\n"
                                          "1a v1.0.0\n"
                                          "2b v1.0.0\n"
                                          "3c v1.0.0\n"
                                          "1d v1.0.0\n");
    NodeIdx root = find_node(graph, "root v0.1.0");
    NodeIdx d = find_node(graph, "d v1.0.0");
    EXPECT_NE(graph.find_edge(root, d), nullptr);
    EXPECT_EQ(graph.edge_count(), 4u);
}

TEST(TreeParserTests, Parse_DistinctVersionsAreDistinctNodes)
{
    CrateGraph graph = TreeParser().parse("0root v0.1.0\n"
                                          "1rand v0.8.5\n"
                                          "2rand_core v0.6.4\n"
                                          "1rand v0.7.3\n");
    EXPECT_EQ(graph.node_count(), 4u);
    EXPECT_EQ(graph.node_weight(find_node(graph, "rand v0.7.3")).short_name(), "rand");
}

TEST(TreeParserTests, Parse_HyphensBecomeUnderscoresInShortName)
{
    CrateGraph graph = TreeParser().parse("0my-app v0.1.0 (/home/user/my-app)\n"
                                          "1serde-json v1.0.0\n");
    const NodeWeight& root = graph.node_weight(graph.root());
    EXPECT_EQ(root.short_name(), "my_app");
    EXPECT_EQ(root.extra(), "v0.1.0 (/home/user/my-app)");
    EXPECT_EQ(graph.node_weight(find_node(graph, "serde_json v1.0.0")).short_name(), "serde_json");
}

TEST(TreeParserTests, Parse_IgnoresCarriageReturnsAndBlankLines)
{
    CrateGraph graph = TreeParser().parse("0root v0.1.0\r\n"
                                          "\r\n"
                                          "1a v1.0.0\r\n"
                                          "\n");
    EXPECT_EQ(graph.node_count(), 2u);
    EXPECT_EQ(graph.node_weight(find_node(graph, "a v1.0.0")).extra(), "v1.0.0");
}

// ============================================================================
// Feature edges
// ============================================================================

TEST(TreeParserTests, Parse_FeatureListing)
{
    CrateGraph graph = TreeParser().parse("0app v0.1.0\n"
                                          "1clap feature \"default\"\n"
                                          "2clap v4.5.0\n"
                                          "3clap_builder v4.5.0\n"
                                          "2clap feature \"color\"\n"
                                          "3clap v4.5.0 (*)\n"
                                          "3clap_builder feature \"color\"\n"
                                          "4clap_builder v4.5.0\n");
    ASSERT_EQ(graph.node_count(), 3u);
    NodeIdx app = find_node(graph, "app v0.1.0");
    NodeIdx clap = find_node(graph, "clap v4.5.0");
    NodeIdx builder = find_node(graph, "clap_builder v4.5.0");

    EXPECT_EQ(graph.edge_count(), 2u);
    EXPECT_NE(graph.find_edge(app, clap), nullptr);
    EXPECT_NE(graph.find_edge(clap, builder), nullptr);

    const FeatureMap expected_clap{{"color", {}}, {"default", {"color"}}};
    EXPECT_EQ(graph.node_weight(clap).features(), expected_clap);

    const FeatureMap expected_builder{{"color", {}}};
    EXPECT_EQ(graph.node_weight(builder).features(), expected_builder);

    const FeatureMap expected_edge{{"color", {"color"}}};
    EXPECT_EQ(graph.edge_weight(clap, builder).features, expected_edge);
    EXPECT_TRUE(graph.edge_weight(app, clap).features.empty());
}

TEST(TreeParserTests, Parse_FeatureBackReferenceResolvesToExpandedCrate)
{
    CrateGraph graph = TreeParser().parse("0app v0.1.0\n"
                                          "1serde feature \"default\"\n"
                                          "2serde v1.0.0\n"
                                          "2serde feature \"std\"\n"
                                          "3serde v1.0.0 (*)\n"
                                          "1serde_json v1.0.140\n"
                                          "2serde feature \"std\" (*)\n");
    ASSERT_EQ(graph.node_count(), 3u);
    NodeIdx serde = find_node(graph, "serde v1.0.0");
    NodeIdx json = find_node(graph, "serde_json v1.0.140");

    EXPECT_NE(graph.find_edge(json, serde), nullptr);
    const FeatureMap expected{{"default", {"std"}}, {"std", {}}};
    EXPECT_EQ(graph.node_weight(serde).features(), expected);
}

TEST(TreeParserTests, Parse_FeatureBackReferenceUsesLatestExpansion)
{
    CrateGraph graph = TreeParser().parse("0app v0.1.0\n"
                                          "1rand feature \"std\"\n"
                                          "2rand v0.7.3\n"
                                          "1x v1.0.0\n"
                                          "2rand feature \"std\"\n"
                                          "3rand v0.8.5\n"
                                          "1y v1.0.0\n"
                                          "2rand feature \"std\" (*)\n");
    NodeIdx old_rand = find_node(graph, "rand v0.7.3");
    NodeIdx new_rand = find_node(graph, "rand v0.8.5");
    NodeIdx y = find_node(graph, "y v1.0.0");

    EXPECT_NE(graph.find_edge(y, new_rand), nullptr);
    EXPECT_EQ(graph.find_edge(y, old_rand), nullptr);
    EXPECT_EQ(graph.neighbors(y, Direction::Outgoing), (std::vector<NodeIdx>{new_rand}));
}

// ============================================================================
// Errors
// ============================================================================

TEST(TreeParserTests, Error_EmptyListingIsEmptyInput)
{
    for (std::string_view listing : {std::string_view(""), std::string_view("\n\n"), std::string_view(" \r\n")})
    {
        try
        {
            TreeParser().parse(listing);
            ADD_FAILURE() << "expected CrateGraphError";
        }
        catch (const TreeParseError&)
        {
            ADD_FAILURE() << "expected EmptyInput, got TreeParseError";
        }
        catch (const CrateGraphError& e)
        {
            EXPECT_EQ(e.code(), CrateGraphErrorCode::EmptyInput);
        }
    }
}

TEST(TreeParserTests, Error_MissingDepthPrefix)
{
    EXPECT_EQ(error_line("app v0.1.0\n"), 1u);
}

TEST(TreeParserTests, Error_MissingVersion)
{
    EXPECT_EQ(error_line("0app v0.1.0\n1serde\n"), 2u);
}

TEST(TreeParserTests, Error_FirstEntryNotAtDepthZero)
{
    EXPECT_EQ(error_line("1app v0.1.0\n"), 1u);
}

TEST(TreeParserTests, Error_DepthJumpsMoreThanOneLevel)
{
    EXPECT_EQ(error_line("0app v0.1.0\n1a v1.0.0\n3b v1.0.0\n"), 3u);
}

TEST(TreeParserTests, Error_SecondRoot)
{
    EXPECT_EQ(error_line("0app v0.1.0\n1a v1.0.0\n0other v1.0.0\n"), 3u);
}

TEST(TreeParserTests, Error_FeatureAtDepthZero)
{
    EXPECT_EQ(error_line("0app feature \"default\"\n"), 1u);
}

TEST(TreeParserTests, Error_FeatureHeaderWithoutCrate)
{
    EXPECT_EQ(error_line("0app v0.1.0\n1a feature \"x\"\n1a v1.0.0\n"), 3u);
    EXPECT_EQ(error_line("0app v0.1.0\n1a feature \"x\"\n"), 2u);
}

TEST(TreeParserTests, Error_UnknownFeatureBackReference)
{
    EXPECT_EQ(error_line("0app v0.1.0\n1a feature \"x\" (*)\n"), 2u);
}

TEST(TreeParserTests, Error_CycleIsMalformed)
{
    EXPECT_EQ(error_line("0a v1.0.0\n1b v1.0.0\n2a v1.0.0 (*)\n"), 3u);
}

TEST(TreeParserTests, Error_CarriesLineText)
{
    try
    {
        TreeParser().parse("0app v0.1.0\n1?bad\n");
        FAIL() << "expected TreeParseError";
    }
    catch (const TreeParseError& e)
    {
        EXPECT_EQ(e.line_number(), 2u);
        EXPECT_EQ(e.line(), "1?bad");
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
    }
}
