#include "union_ring.hpp"
#include "ring_codec.hpp"

namespace blockring
{
    Result<RingPtr> UnionRing::create(RingPtr old_ring, RingPtr new_ring)
    {
        if (!old_ring || !new_ring)
        {
            return {Status::RING_CONSTRUCTION_ERROR, "union ring needs both an old and a new ring"};
        }
        if (old_ring->type() == RingType::UNION || new_ring->type() == RingType::UNION)
        {
            return {Status::RING_CONSTRUCTION_ERROR, "union ring cannot wrap another union ring"};
        }
        return RingPtr(new UnionRing(std::move(old_ring), std::move(new_ring)));
    }

    Result<PeerPermutation> UnionRing::getPeers(const BlockRef &key) const
    {
        auto old_peers = _old->getPeers(key);
        if (!old_peers.ok())
        {
            return {old_peers.status(), "union ring, old side: " + old_peers.message()};
        }
        auto new_peers = _new->getPeers(key);
        if (!new_peers.ok())
        {
            return {new_peers.status(), "union ring, new side: " + new_peers.message()};
        }

        PeerPermutation permutation;
        permutation.peers = unionOf(old_peers.value().holders(), new_peers.value().holders());
        permutation.replication = permutation.peers.size();
        return permutation;
    }

    PeerList UnionRing::members() const
    {
        return unionOf(_old->members(), _new->members());
    }

    std::string UnionRing::describe() const
    {
        return "Ring: Union\nOld:\n" + _old->describe() + "\nNew:\n" + _new->describe();
    }

    Result<Bytes> UnionRing::marshal() const
    {
        auto old_bytes = _old->marshal();
        if (!old_bytes.ok())
        {
            return old_bytes;
        }
        auto new_bytes = _new->marshal();
        if (!new_bytes.ok())
        {
            return new_bytes;
        }

        RingEncoder encoder(RingType::UNION);
        encoder.putBytes(old_bytes.value());
        encoder.putBytes(new_bytes.value());
        return encoder.release();
    }
} // namespace blockring
