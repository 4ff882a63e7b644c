#include "mod_ring.hpp"
#include "ring_codec.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <sstream>

namespace blockring
{
    ModRing::ModRing(RingDescriptor descriptor)
        : _descriptor(std::move(descriptor)), _sorted(toPeerList(_descriptor.peers))
    {
        std::sort(_sorted.begin(), _sorted.end());
    }

    Result<RingPtr> ModRing::create(const RingDescriptor &descriptor)
    {
        std::string reason;
        const auto status = validateMembership(descriptor, reason);
        if (status != Status::OK)
        {
            return {status, "mod ring: " + reason};
        }
        LOG_DEBUG("Created mod ring v{} with {} peers, replication {}",
                  descriptor.version, descriptor.peers.size(), descriptor.replication_factor);
        return RingPtr(new ModRing(descriptor));
    }

    Result<PeerPermutation> ModRing::getPeers(const BlockRef &key) const
    {
        const auto count = _sorted.size();
        if (count == 0)
        {
            return {Status::PLACEMENT_QUERY_ERROR, "mod ring has no peers"};
        }

        const auto start = static_cast<std::size_t>(key.hash() % count);
        PeerPermutation permutation;
        permutation.replication = std::min(_descriptor.replication_factor, count);
        permutation.peers.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            permutation.peers.push_back(_sorted[(start + i) % count]);
        }
        return permutation;
    }

    std::string ModRing::describe() const
    {
        std::ostringstream oss;
        oss << "Ring: Mod\n";
        oss << "Version: " << _descriptor.version << "\n";
        oss << "Replication: " << _descriptor.replication_factor << "\n";
        oss << "Peers:";
        for (const auto &peer : _descriptor.peers)
        {
            oss << "\n\t" << peer.id << " (" << peer.total_blocks << " blocks)";
        }
        return oss.str();
    }

    Result<Bytes> ModRing::marshal() const
    {
        return encodeRingDescriptor(_descriptor);
    }

    Result<RingPtr> ModRing::changeReplication(std::size_t factor) const
    {
        auto next = _descriptor;
        next.replication_factor = factor;
        next.version = _descriptor.version + 1;
        return create(next);
    }

    Result<RingPtr> ModRing::addPeers(const PeerInfoList &peers) const
    {
        auto next = _descriptor;
        next.peers = unionOf(_descriptor.peers, peers);
        next.version = _descriptor.version + 1;
        return create(next);
    }

    Result<RingPtr> ModRing::removePeers(const PeerList &peers) const
    {
        auto next = _descriptor;
        next.peers = difference(_descriptor.peers, peers);
        next.version = _descriptor.version + 1;
        return create(next);
    }
} // namespace blockring
