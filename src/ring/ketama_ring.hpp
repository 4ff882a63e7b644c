#ifndef __KETAMA_RING_HPP__
#define __KETAMA_RING_HPP__

#include "ring_factory.hpp"
#include <map>

namespace blockring
{
    // Weighted consistent hashing. Each peer owns points on a 64-bit circle in
    // proportion to its capacity weight; a block's permutation is the distinct
    // peers met walking clockwise from the block's hash. Adding or removing a
    // peer only disturbs the arcs next to its points.
    class KetamaRing : public Ring, public RingAdder, public RingRemover
    {
    public:
        static constexpr std::size_t VIRTUAL_NODES_PER_PEER = 100;

        [[nodiscard]] static Result<RingPtr> create(const RingDescriptor &descriptor);

        [[nodiscard]] Result<PeerPermutation> getPeers(const BlockRef &key) const override;
        [[nodiscard]] PeerList members() const override { return toPeerList(_descriptor.peers); }

        [[nodiscard]] std::string describe() const override;
        [[nodiscard]] RingType type() const noexcept override { return RingType::KETAMA; }
        [[nodiscard]] std::uint32_t version() const noexcept override { return _descriptor.version; }

        [[nodiscard]] Result<Bytes> marshal() const override;

        [[nodiscard]] Result<RingPtr> changeReplication(std::size_t factor) const override;
        [[nodiscard]] Result<RingPtr> addPeers(const PeerInfoList &peers) const override;
        [[nodiscard]] Result<RingPtr> removePeers(const PeerList &peers) const override;

        [[nodiscard]] std::size_t ringSize() const noexcept { return _points.size(); }
        [[nodiscard]] std::size_t pointsFor(const PeerId &id) const;

    private:
        KetamaRing(RingDescriptor descriptor, const PeerWeights &weights);

        RingDescriptor _descriptor;
        std::map<std::uint64_t, PeerId> _points;
        std::size_t _placeable = 0; // peers that own at least one point
    };
} // namespace blockring

#endif // __KETAMA_RING_HPP__
