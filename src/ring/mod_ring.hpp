#ifndef __MOD_RING_HPP__
#define __MOD_RING_HPP__

#include "ring_factory.hpp"

namespace blockring
{
    // Orders the members by id and starts each block's permutation at
    // hash(block) mod member count. Cheap, but almost every block moves when
    // the member count changes.
    class ModRing : public Ring, public RingAdder, public RingRemover
    {
    public:
        [[nodiscard]] static Result<RingPtr> create(const RingDescriptor &descriptor);

        [[nodiscard]] Result<PeerPermutation> getPeers(const BlockRef &key) const override;
        [[nodiscard]] PeerList members() const override { return _sorted; }

        [[nodiscard]] std::string describe() const override;
        [[nodiscard]] RingType type() const noexcept override { return RingType::MOD; }
        [[nodiscard]] std::uint32_t version() const noexcept override { return _descriptor.version; }

        [[nodiscard]] Result<Bytes> marshal() const override;

        [[nodiscard]] Result<RingPtr> changeReplication(std::size_t factor) const override;
        [[nodiscard]] Result<RingPtr> addPeers(const PeerInfoList &peers) const override;
        [[nodiscard]] Result<RingPtr> removePeers(const PeerList &peers) const override;

    private:
        explicit ModRing(RingDescriptor descriptor);

        RingDescriptor _descriptor;
        PeerList _sorted;
    };
} // namespace blockring

#endif // __MOD_RING_HPP__
