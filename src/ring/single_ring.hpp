#ifndef __SINGLE_RING_HPP__
#define __SINGLE_RING_HPP__

#include "ring_factory.hpp"

namespace blockring
{
    // Every block lives on the one peer, replication 1.
    class SingleRing : public Ring
    {
    public:
        [[nodiscard]] static Result<RingPtr> create(const RingDescriptor &descriptor);

        [[nodiscard]] Result<PeerPermutation> getPeers(const BlockRef &key) const override;
        [[nodiscard]] PeerList members() const override { return {_peer.id}; }

        [[nodiscard]] std::string describe() const override;
        [[nodiscard]] RingType type() const noexcept override { return RingType::SINGLE; }
        [[nodiscard]] std::uint32_t version() const noexcept override { return _version; }

        [[nodiscard]] Result<Bytes> marshal() const override;

    private:
        SingleRing(PeerInfo peer, std::uint32_t version) : _peer(std::move(peer)), _version(version) {}

        PeerInfo _peer;
        std::uint32_t _version;
    };
} // namespace blockring

#endif // __SINGLE_RING_HPP__
