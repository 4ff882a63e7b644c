#include <gtest/gtest.h>
#include "ring/ring_codec.hpp"
#include "ring/ring_factory.hpp"
#include "ring/union_ring.hpp"

using namespace blockring;

class RingCodecTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        for (int i = 0; i < 6; ++i)
        {
            _peers.emplace_back("node-" + std::to_string(i), 1000ULL * (i + 1));
        }
        for (IndexId i = 1; i <= 200; ++i)
        {
            _blocks.emplace_back(3, i % 17, i);
        }
    }

    RingPtr build(RingType type, std::size_t replication, std::size_t peer_count, std::uint32_t version = 7)
    {
        RingDescriptor descriptor;
        descriptor.type = type;
        descriptor.version = version;
        descriptor.replication_factor = replication;
        descriptor.peers = PeerInfoList(_peers.begin(), _peers.begin() + static_cast<std::ptrdiff_t>(peer_count));
        auto ring = createRing(descriptor);
        EXPECT_TRUE(ring.ok()) << ring.describeError();
        return ring.ok() ? ring.value() : nullptr;
    }

    // Decoded ring must answer every query exactly like the encoded one.
    void expectEquivalent(const Ring &encoded, const Ring &decoded)
    {
        EXPECT_EQ(decoded.type(), encoded.type());
        EXPECT_EQ(decoded.version(), encoded.version());
        EXPECT_EQ(decoded.members(), encoded.members());
        EXPECT_EQ(decoded.describe(), encoded.describe());
        for (const auto &block : _blocks)
        {
            auto a = encoded.getPeers(block);
            auto b = decoded.getPeers(block);
            ASSERT_EQ(a.ok(), b.ok());
            if (a.ok())
            {
                EXPECT_EQ(a.value(), b.value());
            }
        }
    }

    PeerInfoList _peers;
    std::vector<BlockRef> _blocks;
};

TEST_F(RingCodecTest, EveryRingKindDecodesToAnEquivalentRing)
{
    std::vector<RingPtr> rings = {
        build(RingType::EMPTY, 0, 0),
        build(RingType::SINGLE, 1, 1),
        build(RingType::MOD, 2, 5),
        build(RingType::KETAMA, 3, 6),
    };
    auto joined = UnionRing::create(build(RingType::MOD, 2, 3, 1), build(RingType::KETAMA, 2, 6, 2));
    ASSERT_TRUE(joined.ok());
    rings.push_back(joined.value());

    for (const auto &ring : rings)
    {
        ASSERT_NE(ring, nullptr);
        auto bytes = ring->marshal();
        ASSERT_TRUE(bytes.ok()) << bytes.describeError();

        auto decoded = unmarshalRing(bytes.value());
        ASSERT_TRUE(decoded.ok()) << ringTypeToString(ring->type()) << ": " << decoded.describeError();
        expectEquivalent(*ring, *decoded.value());
    }
}

TEST_F(RingCodecTest, DecodedRingKeepsCapabilities)
{
    auto ring = build(RingType::KETAMA, 2, 4);
    auto decoded = unmarshalRing(ring->marshal().value());
    ASSERT_TRUE(decoded.ok());

    const auto *adder = asRingAdder(*decoded.value());
    ASSERT_NE(adder, nullptr);
    auto grown = adder->addPeers({_peers[4]});
    ASSERT_TRUE(grown.ok());
    EXPECT_EQ(grown.value()->version(), 8u);
    EXPECT_EQ(grown.value()->members().size(), 5u);
}

TEST_F(RingCodecTest, HeaderLayout)
{
    auto bytes = build(RingType::MOD, 2, 3)->marshal().value();
    ASSERT_GE(bytes.size(), 10u);

    // "RING", format version, type tag, then the big-endian ring version
    EXPECT_EQ(Bytes(bytes.begin(), bytes.begin() + 10), (Bytes{'R', 'I', 'N', 'G', 1, 2, 0, 0, 0, 7}));

    RingDecoder decoder(bytes);
    auto type = decoder.readHeader();
    ASSERT_TRUE(type.ok());
    EXPECT_EQ(type.value(), RingType::MOD);

    auto descriptor = decodeRingDescriptor(decoder, type.value());
    ASSERT_TRUE(descriptor.ok());
    EXPECT_TRUE(decoder.atEnd());
    EXPECT_EQ(descriptor.value().version, 7u);
    EXPECT_EQ(descriptor.value().replication_factor, 2u);
    ASSERT_EQ(descriptor.value().peers.size(), 3u);
    EXPECT_EQ(descriptor.value().peers[2], _peers[2]);
}

TEST_F(RingCodecTest, RejectsCorruptInput)
{
    EXPECT_EQ(unmarshalRing({}).status(), Status::INVALID_REQUEST);
    EXPECT_EQ(unmarshalRing({1, 2, 3, 4, 5, 6, 7, 8}).status(), Status::INVALID_REQUEST);

    const auto bytes = build(RingType::MOD, 2, 4)->marshal().value();

    // every truncation fails cleanly
    for (std::size_t size = 0; size < bytes.size(); ++size)
    {
        Bytes truncated(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(size));
        EXPECT_FALSE(unmarshalRing(truncated).ok()) << "size " << size;
    }

    auto trailing = bytes;
    trailing.push_back(0);
    EXPECT_EQ(unmarshalRing(trailing).status(), Status::INVALID_REQUEST);

    auto bad_version = bytes;
    bad_version[4] = 99;
    EXPECT_EQ(unmarshalRing(bad_version).status(), Status::INVALID_REQUEST);

    auto bad_type = bytes;
    bad_type[5] = 77;
    EXPECT_EQ(unmarshalRing(bad_type).status(), Status::UNKNOWN_RING_KIND);
}

TEST_F(RingCodecTest, DecodedDescriptorIsValidated)
{
    RingDescriptor descriptor;
    descriptor.type = RingType::MOD;
    descriptor.version = 1;
    descriptor.replication_factor = 0;
    descriptor.peers = _peers;

    auto bytes = encodeRingDescriptor(descriptor);
    ASSERT_TRUE(bytes.ok());
    EXPECT_EQ(unmarshalRing(bytes.value()).status(), Status::RING_CONSTRUCTION_ERROR);
}

TEST_F(RingCodecTest, RejectsUnionInsideUnion)
{
    const auto empty = build(RingType::EMPTY, 0, 0)->marshal().value();

    RingEncoder once(RingType::UNION);
    once.putBytes(empty);
    once.putBytes(empty);
    auto nested = once.release();
    ASSERT_TRUE(unmarshalRing(nested).ok());

    // Wrap the union many levels deep on the old side; decoding stops at the
    // first nested union instead of walking every level.
    for (int depth = 0; depth < 500; ++depth)
    {
        RingEncoder wrapper(RingType::UNION);
        wrapper.putBytes(nested);
        wrapper.putBytes(empty);
        nested = wrapper.release();
        EXPECT_EQ(unmarshalRing(nested).status(), Status::INVALID_REQUEST) << "depth " << depth;
    }

    RingEncoder new_side(RingType::UNION);
    new_side.putBytes(empty);
    new_side.putBytes(nested);
    EXPECT_EQ(unmarshalRing(new_side.release()).status(), Status::INVALID_REQUEST);
}
