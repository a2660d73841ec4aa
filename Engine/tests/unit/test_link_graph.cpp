/**
 * @file test_link_graph.cpp
 * @brief Unit tests for translation group construction
 *
 * Greedy grouping, union-find grouping and the inclusion filter.
 * Pure in-memory, no files.
 */

#include "../test_support.hpp"
#include <corpus/link_graph.hpp>
#include <corpus/errors.hpp>
#include <utility>
#include <vector>

using namespace Rosetta;

using Edges = std::vector<std::pair<SentenceID, SentenceID>>;

static LinkGraph build(const Edges& edges, LinkFilter filter = LinkFilter(),
                       GroupingStrategy strategy = GroupingStrategy::Greedy) {
    LinkGraphBuilder builder(std::move(filter), strategy);
    for (const auto& [a, b] : edges) builder.add_edge(a, b);
    return builder.finalize();
}

// ============================================================================
// Greedy grouping
// ============================================================================

TEST(LinkGraphTest, ChainFormsOneGroup) {
    auto graph = build({{6381, 156245}, {156245, 258289}, {258289, 817971}});

    const TranslationGroup expected{6381, 156245, 258289, 817971};
    ASSERT_EQ(graph.groups.size(), 1u);

    const TranslationGroup* first = graph.find(6381);
    const TranslationGroup* last = graph.find(817971);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(*first, expected);
    EXPECT_EQ(first, last);
}

TEST(LinkGraphTest, DisjointChainsPartitionIds) {
    auto graph = build({{1, 2}, {2, 1}, {3, 4}, {4, 5}, {5, 3}, {6, 7}});

    ASSERT_EQ(graph.groups.size(), 3u);
    EXPECT_EQ(*graph.find(1), (TranslationGroup{1, 2}));
    EXPECT_EQ(*graph.find(5), (TranslationGroup{3, 4, 5}));
    EXPECT_EQ(*graph.find(7), (TranslationGroup{6, 7}));

    size_t members = 0;
    for (const auto& [gid, group] : graph.groups) members += group.size();
    EXPECT_EQ(members, graph.assignment.size());
}

TEST(LinkGraphTest, UnseenIdHasNoGroup) {
    auto graph = build({{1, 2}});
    EXPECT_EQ(graph.find(3), nullptr);
}

TEST(LinkGraphTest, GroupIdsAreAssignedInOrder) {
    auto graph = build({{10, 11}, {20, 21}, {30, 31}});
    EXPECT_EQ(graph.assignment.at(10), 0u);
    EXPECT_EQ(graph.assignment.at(21), 1u);
    EXPECT_EQ(graph.assignment.at(30), 2u);
}

TEST(LinkGraphTest, GreedyDoesNotMergeExistingGroups) {
    // 1 and 3 already belong to different groups when (1, 3) arrives
    auto graph = build({{1, 2}, {3, 4}, {1, 3}});

    ASSERT_EQ(graph.groups.size(), 2u);
    EXPECT_EQ(graph.assignment.at(3), graph.assignment.at(1));
    EXPECT_EQ(*graph.find(3), (TranslationGroup{1, 2, 3}));
    EXPECT_EQ(*graph.find(4), (TranslationGroup{3, 4}));
}

TEST(LinkGraphTest, SecondEndpointGroupIsUsed) {
    auto graph = build({{1, 2}, {9, 2}});
    EXPECT_EQ(*graph.find(9), (TranslationGroup{1, 2, 9}));
}

TEST(LinkGraphTest, FinalizeResetsBuilder) {
    LinkGraphBuilder builder;
    builder.add_edge(1, 2);
    auto first = builder.finalize();
    EXPECT_EQ(first.groups.size(), 1u);

    builder.add_edge(5, 6);
    auto second = builder.finalize();
    EXPECT_EQ(second.assignment.at(5), 0u);
    EXPECT_EQ(second.find(1), nullptr);
}

TEST(LinkGraphTest, Idempotent) {
    Edges edges{{1, 2}, {2, 3}, {7, 8}, {3, 1}};
    EXPECT_EQ(build(edges), build(edges));
}

// ============================================================================
// Union-find grouping
// ============================================================================

TEST(LinkGraphTest, UnionFindMergesSplitGroups) {
    auto graph = build({{1, 2}, {3, 4}, {1, 3}}, LinkFilter(), GroupingStrategy::UnionFind);

    ASSERT_EQ(graph.groups.size(), 1u);
    EXPECT_EQ(*graph.find(4), (TranslationGroup{1, 2, 3, 4}));
    EXPECT_EQ(graph.find(1), graph.find(4));
}

TEST(LinkGraphTest, UnionFindMatchesGreedyOnContiguousInput) {
    Edges edges{{1, 2}, {1, 3}, {2, 1}, {3, 1}, {10, 11}, {11, 10}, {20, 21}};
    auto greedy = build(edges);
    auto uf = build(edges, LinkFilter(), GroupingStrategy::UnionFind);
    EXPECT_EQ(greedy, uf);
}

// ============================================================================
// Inclusion filter
// ============================================================================

TEST(LinkFilterTest, NoAllowListKeepsEverything) {
    for (auto mode : {LinkFilterMode::SentenceId, LinkFilterMode::TranslationId, LinkFilterMode::Both}) {
        LinkFilter filter(mode, std::nullopt);
        EXPECT_TRUE(filter.accepts(1, 2));
        EXPECT_FALSE(filter.restricts());
    }
}

TEST(LinkFilterTest, TranslationIdScreensOnlyTranslation) {
    LinkFilter filter(LinkFilterMode::TranslationId, LinkFilter::IdSet{6381});
    EXPECT_FALSE(filter.accepts(6381, 9999));
    EXPECT_TRUE(filter.accepts(9999, 6381));
}

TEST(LinkFilterTest, SentenceIdScreensOnlySentence) {
    LinkFilter filter(LinkFilterMode::SentenceId, LinkFilter::IdSet{6381});
    EXPECT_TRUE(filter.accepts(6381, 9999));
    EXPECT_FALSE(filter.accepts(9999, 6381));
}

TEST(LinkFilterTest, BothScreensBothEndpoints) {
    LinkFilter filter(LinkFilterMode::Both, LinkFilter::IdSet{1, 2});
    EXPECT_TRUE(filter.accepts(1, 2));
    EXPECT_FALSE(filter.accepts(1, 3));
    EXPECT_FALSE(filter.accepts(3, 2));
}

TEST(LinkFilterTest, BuilderCountsDroppedEdges) {
    LinkGraphBuilder builder(LinkFilter(LinkFilterMode::TranslationId, LinkFilter::IdSet{6381}));
    EXPECT_FALSE(builder.add_edge(6381, 9999));
    EXPECT_TRUE(builder.add_edge(9999, 6381));
    EXPECT_EQ(builder.edges_seen(), 2u);
    EXPECT_EQ(builder.edges_kept(), 1u);
}

TEST(LinkFilterTest, ParseMode) {
    EXPECT_EQ(parse_link_filter_mode("sentence_id"), LinkFilterMode::SentenceId);
    EXPECT_EQ(parse_link_filter_mode("TRANS_ID"), LinkFilterMode::TranslationId);
    EXPECT_EQ(parse_link_filter_mode("Both"), LinkFilterMode::Both);
    EXPECT_EQ(to_string(LinkFilterMode::TranslationId), "translation_id");
    EXPECT_THROW(parse_link_filter_mode("banana"), InvalidArgumentError);
}

TEST(LinkFilterTest, ParseGrouping) {
    EXPECT_EQ(parse_grouping_strategy("union_find"), GroupingStrategy::UnionFind);
    EXPECT_EQ(to_string(GroupingStrategy::Greedy), "greedy");
    EXPECT_THROW(parse_grouping_strategy("components"), InvalidArgumentError);
}
