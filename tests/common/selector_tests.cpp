/**
 * @file selector_tests.cpp
 * Unit tests for root and exclude pattern resolution
 */
#include <gtest/gtest.h>
#include "cratescope/common/selector.hpp"

using namespace cratescope;

namespace
{

NodeWeight crate(const std::string& full_name)
{
    return NodeWeight(full_name, full_name.find(' '));
}

// app -> serde v1.0.0, app -> serde_json, serde_json -> serde v1.0.0, app -> rand v0.7.3,
// app -> rand v0.8.5
CrateGraph make_graph()
{
    std::vector<NodeWeight> nodes{
        crate("app v0.1.0"),
        crate("serde v1.0.0"),
        crate("serde_json v1.0.140"),
        crate("rand v0.7.3"),
        crate("rand v0.8.5"),
    };
    return CrateGraph(std::move(nodes), {{0, 1, {}}, {0, 2, {}}, {2, 1, {}}, {0, 3, {}}, {0, 4, {}}});
}

} // namespace

// ============================================================================
// match_nodes
// ============================================================================

TEST(SelectorTests, MatchNodes_UsesFullNamePrefix)
{
    CrateGraph graph = make_graph();
    EXPECT_EQ(match_nodes(graph, "serde"), (std::vector<NodeIdx>{1, 2}));
    EXPECT_EQ(match_nodes(graph, "serde v"), (std::vector<NodeIdx>{1}));
    EXPECT_EQ(match_nodes(graph, "rand v0.8"), (std::vector<NodeIdx>{4}));
    EXPECT_TRUE(match_nodes(graph, "tokio").empty());
}

// ============================================================================
// select_root
// ============================================================================

TEST(SelectorTests, SelectRoot_UniqueMatch)
{
    CrateGraph graph = make_graph();
    EXPECT_EQ(select_root(graph, "serde_json"), 2u);
}

TEST(SelectorTests, SelectRoot_AmbiguousPatternListsEveryMatch)
{
    CrateGraph graph = make_graph();
    try
    {
        select_root(graph, "rand");
        FAIL() << "expected AmbiguousSelectorError";
    }
    catch (const AmbiguousSelectorError& e)
    {
        EXPECT_EQ(e.code(), CrateGraphErrorCode::AmbiguousSelector);
        EXPECT_EQ(e.pattern(), "rand");
        EXPECT_EQ(e.matches(), (std::vector<NodeIdx>{3, 4}));
        EXPECT_TRUE(e.is_usage_error());
    }
}

TEST(SelectorTests, SelectRoot_NoMatchIsAmbiguousWithEmptyList)
{
    CrateGraph graph = make_graph();
    try
    {
        select_root(graph, "tokio");
        FAIL() << "expected AmbiguousSelectorError";
    }
    catch (const AmbiguousSelectorError& e)
    {
        EXPECT_TRUE(e.matches().empty());
    }
}

// ============================================================================
// select_excludes
// ============================================================================

TEST(SelectorTests, SelectExcludes_ReturnsSortedUnion)
{
    CrateGraph graph = make_graph();
    std::vector<NodeIdx> selected = select_excludes(graph, {"rand v0.8", "serde_json", "rand v0.8.5"});
    EXPECT_EQ(selected, (std::vector<NodeIdx>{2, 4}));
}

TEST(SelectorTests, SelectExcludes_AnyAmbiguousPatternThrows)
{
    CrateGraph graph = make_graph();
    EXPECT_THROW(select_excludes(graph, {"serde_json", "serde"}), AmbiguousSelectorError);
}

TEST(SelectorTests, SelectExcludes_NoPatternsSelectsNothing)
{
    CrateGraph graph = make_graph();
    EXPECT_TRUE(select_excludes(graph, {}).empty());
}
