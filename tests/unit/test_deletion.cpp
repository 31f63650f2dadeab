#include <gtest/gtest.h>
#include "update/deletion.hpp"

using namespace isum;

class DeletionTest : public ::testing::Test {
protected:
    SummaryGraph graph;
    CliqueIndex cliques;

    void prepare(const std::vector<Triple>& facts) {
        graph = SummaryGraph::from_triples(facts);
    }

    void expect_consistent() const {
        std::string error;
        EXPECT_TRUE(graph.validate(error)) << error;
        EXPECT_TRUE(cliques.validate(error)) << error;
    }
};

// ==========================================
// Scenario Tests
// ==========================================

TEST_F(DeletionTest, SharedObjectsSplitAndCollapse) {
    prepare({Triple(1, 10, 2), Triple(1, 10, 3)});
    graph.new_snode({2, 3}, 99);
    cliques.build(graph);

    DeletionMaintainer maintainer(graph, cliques);
    maintainer.apply(Triple(1, 10, 2));

    EXPECT_FALSE(graph.contains_supernode(99));
    EXPECT_FALSE(graph.has_parent(2));
    EXPECT_FALSE(graph.has_parent(3));
    EXPECT_TRUE(graph.node(2).incoming.empty());
    EXPECT_EQ(graph.node(3).incoming, EdgeList{Edge(10, 1)});
    EXPECT_EQ(graph.node(1).outgoing, EdgeList{Edge(10, 3)});

    // The survivor took over the clique slots of the supernode
    EXPECT_FALSE(cliques.contains(99));
    EXPECT_TRUE(cliques.contains(3));
    EXPECT_TRUE(cliques.contains(2));
    EXPECT_TRUE(cliques.clique_of(3, CliqueRole::Target).has_pred(10));
    EXPECT_TRUE(cliques.clique_of(2, CliqueRole::Target).preds.empty());

    const auto& stats = maintainer.statistics();
    EXPECT_EQ(stats.triples_processed, 1);
    EXPECT_EQ(stats.edges_removed, 2);
    EXPECT_EQ(stats.splits, 1);
    EXPECT_EQ(stats.collapses, 1);
    expect_consistent();
}

// ==========================================
// Split Tests
// ==========================================

class ThreeMemberClusterTest : public DeletionTest {
protected:
    // a=1 shares (20,10) with b=2 and (21,11) with c=3; b and c share (22,12)
    void SetUp() override {
        prepare({
            Triple(10, 20, 1), Triple(10, 20, 2),
            Triple(11, 21, 1), Triple(11, 21, 3),
            Triple(12, 22, 2), Triple(12, 22, 3)
        });
        graph.new_snode({1, 2, 3}, 100);
        cliques.build(graph);
    }
};

TEST_F(ThreeMemberClusterTest, StaysWhileEdgesOverlap) {
    DeletionMaintainer maintainer(graph, cliques);
    maintainer.apply(Triple(11, 21, 1));

    EXPECT_EQ(graph.get_parent(1), std::optional<NodeId>(100));
    EXPECT_EQ(graph.members(100), (std::vector<NodeId>{1, 2, 3}));
    EXPECT_EQ(maintainer.statistics().detach_attempts, 1);
    EXPECT_EQ(maintainer.statistics().reverts, 1);
    EXPECT_EQ(maintainer.statistics().splits, 0);
    expect_consistent();
}

TEST_F(ThreeMemberClusterTest, SplitsDetachedNodeOnly) {
    DeletionMaintainer maintainer(graph, cliques);
    maintainer.apply(Triple(11, 21, 1));
    maintainer.apply(Triple(10, 20, 1));

    // The endpoint itself leaves, not another member
    EXPECT_FALSE(graph.has_parent(1));
    EXPECT_EQ(graph.get_parent(2), std::optional<NodeId>(100));
    EXPECT_EQ(graph.get_parent(3), std::optional<NodeId>(100));
    EXPECT_EQ(graph.members(100), (std::vector<NodeId>{2, 3}));
    EXPECT_EQ(maintainer.statistics().splits, 1);
    EXPECT_EQ(maintainer.statistics().collapses, 0);

    EXPECT_TRUE(cliques.contains(1));
    EXPECT_TRUE(cliques.contains(100));
    expect_consistent();
}

TEST_F(ThreeMemberClusterTest, SplitCheckReadsCurrentMembers) {
    DeletionMaintainer maintainer(graph, cliques);
    maintainer.apply({Triple(11, 21, 1), Triple(10, 20, 1), Triple(12, 22, 2)});

    // b is left with (20,10) only, which c never had
    EXPECT_FALSE(graph.contains_supernode(100));
    EXPECT_FALSE(graph.has_parent(2));
    EXPECT_FALSE(graph.has_parent(3));
    EXPECT_EQ(maintainer.statistics().splits, 2);
    EXPECT_EQ(maintainer.statistics().collapses, 1);
    expect_consistent();
}

TEST_F(DeletionTest, OverlapIsComparedPerDirection) {
    // 1 keeps outgoing (30,5) while 2 has incoming (30,5): not the same edge
    prepare({
        Triple(1, 30, 5), Triple(5, 30, 2),
        Triple(6, 31, 1), Triple(6, 31, 2)
    });
    graph.new_snode({1, 2}, 99);
    cliques.build(graph);

    EXPECT_TRUE(shares_edge(graph, 1, graph.members(99)));

    DeletionMaintainer maintainer(graph, cliques);
    maintainer.apply(Triple(6, 31, 1));

    EXPECT_FALSE(shares_edge(graph, 1, {2}));
    EXPECT_FALSE(graph.contains_supernode(99));
    EXPECT_FALSE(graph.has_parent(1));
    EXPECT_FALSE(graph.has_parent(2));
    expect_consistent();
}

// ==========================================
// Collapse Tests
// ==========================================

TEST_F(DeletionTest, TwoMemberClusterCollapses) {
    prepare({Triple(1, 10, 3), Triple(2, 10, 3), Triple(2, 11, 4)});
    graph.new_snode({1, 2}, 99);
    cliques.build(graph);

    DeletionMaintainer maintainer(graph, cliques);
    maintainer.apply(Triple(1, 10, 3));

    EXPECT_FALSE(graph.contains_supernode(99));
    EXPECT_FALSE(graph.get_parent(2).has_value());
    EXPECT_FALSE(graph.get_parent(1).has_value());

    // 2 sits where 99 was: source fingerprint {10, 11}
    const Clique& source = cliques.clique_of(2, CliqueRole::Source);
    EXPECT_EQ(source.preds, (std::vector<NodeId>{10, 11}));
    EXPECT_TRUE(source.has_member(2));
    EXPECT_FALSE(source.has_member(99));
    expect_consistent();
}

TEST_F(DeletionTest, SurvivorFingerprintDropsDepartedPredicates) {
    // 1 alone carries 11; after it leaves, 2 only points along 10
    prepare({Triple(1, 10, 5), Triple(1, 11, 6), Triple(2, 10, 5)});
    graph.new_snode({1, 2}, 99);
    cliques.build(graph);
    ASSERT_EQ(cliques.clique_of(99, CliqueRole::Source).preds, (std::vector<NodeId>{10, 11}));

    DeletionMaintainer maintainer(graph, cliques);
    maintainer.apply(Triple(1, 10, 5));

    ASSERT_FALSE(graph.contains_supernode(99));
    const Clique& source = cliques.clique_of(2, CliqueRole::Source);
    EXPECT_EQ(source.nodes, std::vector<NodeId>{2});
    EXPECT_EQ(source.preds, graph.outgoing_predicates(2));
    EXPECT_EQ(source.preds, std::vector<NodeId>{10});
    EXPECT_EQ(cliques.clique_of(1, CliqueRole::Source).preds, std::vector<NodeId>{11});
    expect_consistent();
}

TEST_F(DeletionTest, RemainingSupernodeFingerprintIsRefreshed) {
    prepare({
        Triple(1, 10, 5), Triple(1, 11, 6),
        Triple(2, 10, 5), Triple(3, 10, 5)
    });
    graph.new_snode({1, 2, 3}, 99);
    cliques.build(graph);

    DeletionMaintainer maintainer(graph, cliques);
    maintainer.apply(Triple(1, 10, 5));

    ASSERT_EQ(graph.members(99), (std::vector<NodeId>{2, 3}));
    const Clique& source = cliques.clique_of(99, CliqueRole::Source);
    EXPECT_EQ(source.preds, graph.outgoing_predicates(99));
    EXPECT_FALSE(source.has_pred(11));
    EXPECT_EQ(maintainer.statistics().refreshes, 1);
    EXPECT_EQ(maintainer.statistics().collapses, 0);
    expect_consistent();
}

TEST_F(DeletionTest, SurvivorLeavesSharedCliqueWithOtherFingerprint) {
    // 7 shares the {10, 11} source clique of 99
    prepare({
        Triple(1, 10, 5), Triple(1, 11, 6), Triple(2, 10, 5), Triple(2, 11, 8),
        Triple(7, 10, 5), Triple(7, 11, 6)
    });
    graph.new_snode({1, 2}, 99);
    cliques.build(graph);
    ASSERT_EQ(cliques.index_of(99, CliqueRole::Source), cliques.index_of(7, CliqueRole::Source));

    DeletionMaintainer maintainer(graph, cliques);
    maintainer.apply({Triple(2, 11, 8), Triple(1, 10, 5)});

    // 1 kept (11,6) and 2 kept (10,5): no overlap, 99 collapses into 2
    ASSERT_FALSE(graph.contains_supernode(99));
    EXPECT_NE(cliques.index_of(2, CliqueRole::Source), cliques.index_of(7, CliqueRole::Source));
    EXPECT_EQ(cliques.clique_of(2, CliqueRole::Source).preds, std::vector<NodeId>{10});
    EXPECT_EQ(cliques.clique_of(7, CliqueRole::Source).preds, (std::vector<NodeId>{10, 11}));
    expect_consistent();
}

TEST_F(DeletionTest, EndpointsInSameCluster) {
    prepare({Triple(1, 10, 2), Triple(3, 11, 1), Triple(3, 11, 2)});
    graph.new_snode({1, 2}, 99);
    cliques.build(graph);

    DeletionMaintainer maintainer(graph, cliques);
    maintainer.apply(Triple(3, 11, 1));

    // 1 keeps outgoing (10,2), 2 keeps incoming (10,1) and (11,3): no overlap
    EXPECT_FALSE(graph.contains_supernode(99));
    EXPECT_EQ(graph.num_supernodes(), 0);
    expect_consistent();
}

// ==========================================
// Fingerprint Tests
// ==========================================

TEST_F(DeletionTest, SingletonCliqueDropsUnjustifiedPredicate) {
    prepare({Triple(1, 10, 2), Triple(3, 11, 2)});
    cliques.build(graph);

    DeletionMaintainer maintainer(graph, cliques);
    maintainer.apply(Triple(1, 10, 2));

    EXPECT_FALSE(cliques.clique_of(1, CliqueRole::Source).has_pred(10));
    EXPECT_FALSE(cliques.clique_of(2, CliqueRole::Target).has_pred(10));
    EXPECT_TRUE(cliques.clique_of(2, CliqueRole::Target).has_pred(11));
    EXPECT_EQ(maintainer.statistics().fingerprints_pruned, 2);
    expect_consistent();
}

TEST_F(DeletionTest, SharedCliqueKeepsPredicate) {
    prepare({Triple(1, 10, 2), Triple(3, 10, 4)});
    cliques.build(graph);
    ASSERT_EQ(cliques.index_of(1, CliqueRole::Source), cliques.index_of(3, CliqueRole::Source));

    DeletionMaintainer maintainer(graph, cliques);
    maintainer.apply(Triple(1, 10, 2));

    EXPECT_TRUE(cliques.clique_of(1, CliqueRole::Source).has_pred(10));
    expect_consistent();
}

TEST_F(DeletionTest, PredicateStillCarriedIsKept) {
    prepare({Triple(1, 10, 2), Triple(1, 10, 3)});
    cliques.build(graph);

    DeletionMaintainer maintainer(graph, cliques);
    maintainer.apply(Triple(1, 10, 2));

    EXPECT_TRUE(cliques.clique_of(1, CliqueRole::Source).has_pred(10));
}

// ==========================================
// Error Tests
// ==========================================

TEST_F(DeletionTest, MissingEdgeIsCounted) {
    prepare({Triple(1, 10, 2), Triple(3, 10, 4)});
    cliques.build(graph);

    DeletionMaintainer maintainer(graph, cliques);
    maintainer.apply(Triple(1, 10, 4));

    EXPECT_EQ(maintainer.statistics().edges_missing, 2);
    EXPECT_EQ(maintainer.statistics().edges_removed, 0);
    EXPECT_EQ(graph.node(1).outgoing.size(), 1);
    expect_consistent();
}

TEST_F(DeletionTest, UnknownEndpointThrows) {
    prepare({Triple(1, 10, 2)});
    cliques.build(graph);

    DeletionMaintainer maintainer(graph, cliques);
    EXPECT_THROW(maintainer.apply(Triple(1, 10, 42)), ConsistencyError);
}

TEST_F(DeletionTest, SupernodeEndpointThrows) {
    prepare({Triple(1, 10, 2), Triple(1, 10, 3)});
    graph.new_snode({2, 3}, 99);
    cliques.build(graph);

    DeletionMaintainer maintainer(graph, cliques);
    EXPECT_THROW(maintainer.apply(Triple(1, 10, 99)), ConsistencyError);
}

TEST_F(DeletionTest, EarlierTriplesStayAppliedAfterFailure) {
    prepare({Triple(1, 10, 2), Triple(3, 11, 4)});
    cliques.build(graph);

    DeletionMaintainer maintainer(graph, cliques);
    EXPECT_THROW(maintainer.apply({Triple(1, 10, 2), Triple(42, 11, 4)}), ConsistencyError);

    EXPECT_TRUE(graph.node(1).outgoing.empty());
    EXPECT_EQ(maintainer.statistics().triples_processed, 1);
}

TEST_F(DeletionTest, StatisticsToJson) {
    prepare({Triple(1, 10, 2), Triple(1, 10, 3)});
    graph.new_snode({2, 3}, 99);
    cliques.build(graph);

    DeletionMaintainer maintainer(graph, cliques);
    maintainer.apply(Triple(1, 10, 2));

    auto j = maintainer.statistics().to_json();
    EXPECT_EQ(j["splits"], 1);
    EXPECT_EQ(j["collapses"], 1);

    maintainer.reset_statistics();
    EXPECT_EQ(maintainer.statistics().triples_processed, 0);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
