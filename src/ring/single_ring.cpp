#include "single_ring.hpp"
#include "ring_codec.hpp"
#include "../common/logger.hpp"

namespace blockring
{
    Result<RingPtr> SingleRing::create(const RingDescriptor &descriptor)
    {
        if (descriptor.peers.size() != 1)
        {
            return {Status::RING_CONSTRUCTION_ERROR,
                    "single ring needs exactly one peer, got " + std::to_string(descriptor.peers.size())};
        }
        if (descriptor.replication_factor > 1)
        {
            LOG_WARN("Single ring ignores replication factor {}", descriptor.replication_factor);
        }
        return RingPtr(new SingleRing(descriptor.peers.front(), descriptor.version));
    }

    Result<PeerPermutation> SingleRing::getPeers(const BlockRef &) const
    {
        PeerPermutation permutation;
        permutation.replication = 1;
        permutation.peers = {_peer.id};
        return permutation;
    }

    std::string SingleRing::describe() const
    {
        return "Ring: Single\nVersion: " + std::to_string(_version) + "\nPeer: " + _peer.id;
    }

    Result<Bytes> SingleRing::marshal() const
    {
        RingDescriptor descriptor;
        descriptor.type = RingType::SINGLE;
        descriptor.version = _version;
        descriptor.replication_factor = 1;
        descriptor.peers = {_peer};
        return encodeRingDescriptor(descriptor);
    }
} // namespace blockring
