#include <gtest/gtest.h>
#include "cluster/peer_list.hpp"
#include <set>

using namespace blockring;

TEST(PeerList, IndexOfAndContains)
{
    const PeerList peers = {"a", "b", "c", "b"};

    EXPECT_EQ(indexOf(peers, "a"), 0u);
    EXPECT_EQ(indexOf(peers, "b"), 1u); // first occurrence
    EXPECT_EQ(indexOf(peers, "c"), 2u);
    EXPECT_EQ(indexOf(peers, "z"), PEER_NOT_FOUND);
    EXPECT_EQ(indexOf(PeerList{}, "a"), PEER_NOT_FOUND);

    EXPECT_TRUE(contains(peers, "c"));
    EXPECT_FALSE(contains(peers, "z"));
    EXPECT_FALSE(contains(PeerList{}, "a"));
}

TEST(PeerList, NotFoundComparesGreaterThanAnyPosition)
{
    const PeerList peers = {"a", "b"};
    EXPECT_GE(indexOf(peers, "z"), peers.size());
}

TEST(PeerList, DifferenceKeepsLeftOrder)
{
    const PeerList a = {"d", "a", "c", "b"};
    const PeerList b = {"c", "x"};

    EXPECT_EQ(difference(a, b), (PeerList{"d", "a", "b"}));
    EXPECT_EQ(difference(a, PeerList{}), a);
    EXPECT_TRUE(difference(PeerList{}, b).empty());
    EXPECT_TRUE(difference(a, a).empty());

    for (const auto &id : difference(a, b))
    {
        EXPECT_FALSE(contains(b, id));
    }
}

TEST(PeerList, UnionPutsLeftFirst)
{
    const PeerList a = {"c", "a"};
    const PeerList b = {"b", "a", "d"};

    EXPECT_EQ(unionOf(a, b), (PeerList{"c", "a", "b", "d"}));
    EXPECT_EQ(unionOf(b, a), (PeerList{"b", "a", "d", "c"}));
    EXPECT_EQ(unionOf(a, PeerList{}), a);
    EXPECT_EQ(unionOf(PeerList{}, b), b);
}

TEST(PeerList, UnionIsSetUnionWithoutDuplicates)
{
    const PeerList a = {"p1", "p2", "p3"};
    const PeerList b = {"p3", "p4", "p1", "p5"};

    const auto u = unionOf(a, b);
    const std::set<PeerId> as_set(u.begin(), u.end());
    EXPECT_EQ(as_set.size(), u.size());
    EXPECT_EQ(as_set, (std::set<PeerId>{"p1", "p2", "p3", "p4", "p5"}));
}

TEST(PeerList, IntersectKeepsLeftOrder)
{
    const PeerList a = {"e", "b", "a", "d"};
    const PeerList b = {"a", "b", "c"};

    EXPECT_EQ(intersect(a, b), (PeerList{"b", "a"}));
    EXPECT_EQ(intersect(b, a), (PeerList{"a", "b"}));
    EXPECT_TRUE(intersect(a, PeerList{}).empty());
}

TEST(PeerList, ToString)
{
    EXPECT_EQ(peerListToString({}), "[]");
    EXPECT_EQ(peerListToString({"a", "b"}), "[a, b]");
}
