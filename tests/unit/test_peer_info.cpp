#include <gtest/gtest.h>
#include "cluster/peer_info.hpp"

using namespace blockring;

namespace
{
    PeerInfoList makePeers(const std::vector<std::uint64_t> &capacities)
    {
        PeerInfoList peers;
        for (std::size_t i = 0; i < capacities.size(); ++i)
        {
            peers.emplace_back("p" + std::to_string(i), capacities[i]);
        }
        return peers;
    }
} // namespace

TEST(PeerInfoList, SetOperationsCompareById)
{
    const PeerInfoList a = {{"a", 10}, {"b", 20}, {"c", 30}};
    const PeerInfoList b = {{"c", 999}, {"d", 40}};

    EXPECT_EQ(indexOf(a, "b"), 1u);
    EXPECT_EQ(indexOf(a, "d"), PEER_NOT_FOUND);
    EXPECT_TRUE(contains(b, "d"));

    const auto diff = difference(a, PeerList{"a", "z"});
    ASSERT_EQ(diff.size(), 2u);
    EXPECT_EQ(diff[0], (PeerInfo{"b", 20}));
    EXPECT_EQ(diff[1], (PeerInfo{"c", 30}));

    // a's descriptor wins for the shared id
    const auto u = unionOf(a, b);
    ASSERT_EQ(u.size(), 4u);
    EXPECT_EQ(u[2], (PeerInfo{"c", 30}));
    EXPECT_EQ(u[3], (PeerInfo{"d", 40}));

    const auto i = intersect(a, b);
    ASSERT_EQ(i.size(), 1u);
    EXPECT_EQ(i[0], (PeerInfo{"c", 30}));
}

TEST(PeerInfoList, ProjectsToPeerList)
{
    const PeerInfoList peers = {{"z", 1}, {"a", 2}, {"m", 3}};
    EXPECT_EQ(toPeerList(peers), (PeerList{"z", "a", "m"}));
    EXPECT_TRUE(toPeerList({}).empty());
}

TEST(CapacityWeights, DividesByCommonDivisor)
{
    const auto weights = getWeights(makePeers({100, 200, 300}));
    ASSERT_TRUE(weights.ok());
    EXPECT_EQ(weights.value(), (PeerWeights{{"p0", 1}, {"p1", 2}, {"p2", 3}}));
}

TEST(CapacityWeights, EqualCapacitiesGiveUnitWeights)
{
    const auto weights = getWeights(makePeers({5, 5, 5}));
    ASSERT_TRUE(weights.ok());
    for (const auto &[id, weight] : weights.value())
    {
        EXPECT_EQ(weight, 1u) << id;
    }
    EXPECT_EQ(weights.value().size(), 3u);
}

TEST(CapacityWeights, EmptyInputGivesEmptyMap)
{
    const auto weights = getWeights({});
    ASSERT_TRUE(weights.ok());
    EXPECT_TRUE(weights.value().empty());
}

TEST(CapacityWeights, AllZeroCapacitiesFail)
{
    const auto weights = getWeights(makePeers({0, 0}));
    ASSERT_FALSE(weights.ok());
    EXPECT_EQ(weights.status(), Status::CAPACITY_WEIGHT_UNDEFINED);
    EXPECT_THROW(weights.value(), std::runtime_error);
}

TEST(CapacityWeights, ZeroCapacityPeerGetsZeroWeight)
{
    const auto weights = getWeights(makePeers({0, 40, 60}));
    ASSERT_TRUE(weights.ok());
    EXPECT_EQ(weights.value(), (PeerWeights{{"p0", 0}, {"p1", 2}, {"p2", 3}}));
}

TEST(CapacityWeights, LargeCapacities)
{
    const std::uint64_t giga = 100ULL * 1024 * 1024 * 1024;
    const auto weights = getWeights(makePeers({giga, 2 * giga, giga + 1}));
    ASSERT_TRUE(weights.ok());
    EXPECT_EQ(weights.value().at("p0"), giga);
    EXPECT_EQ(weights.value().at("p1"), 2 * giga);
    EXPECT_EQ(weights.value().at("p2"), giga + 1);
}
