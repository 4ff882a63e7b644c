#include "ketama_ring.hpp"
#include "ring_codec.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_set>

namespace blockring
{
    KetamaRing::KetamaRing(RingDescriptor descriptor, const PeerWeights &weights)
        : _descriptor(std::move(descriptor))
    {
        long double total_weight = 0;
        for (const auto &[id, weight] : weights)
        {
            total_weight += static_cast<long double>(weight);
        }

        const auto peer_count = static_cast<long double>(_descriptor.peers.size());
        for (const auto &peer : _descriptor.peers)
        {
            const auto weight = weights.at(peer.id);
            if (weight == 0)
            {
                LOG_WARN("Peer {} has no capacity and receives no placements", peer.id);
                continue;
            }

            const auto share = static_cast<long double>(VIRTUAL_NODES_PER_PEER) * peer_count *
                               static_cast<long double>(weight) / total_weight;
            const auto count = std::max<std::size_t>(1, static_cast<std::size_t>(std::llround(share)));
            for (std::size_t i = 0; i < count; ++i)
            {
                // A colliding point keeps its first owner.
                _points.emplace(stableHash(peer.id + "#" + std::to_string(i)), peer.id);
            }
            ++_placeable;
        }
    }

    Result<RingPtr> KetamaRing::create(const RingDescriptor &descriptor)
    {
        std::string reason;
        const auto status = validateMembership(descriptor, reason);
        if (status != Status::OK)
        {
            return {status, "ketama ring: " + reason};
        }

        auto weights = getWeights(descriptor.peers);
        if (!weights.ok())
        {
            return {weights.status(), "ketama ring: " + weights.message()};
        }

        auto ring = std::shared_ptr<KetamaRing>(new KetamaRing(descriptor, weights.value()));
        LOG_DEBUG("Created ketama ring v{} with {} peers, {} points, replication {}",
                  descriptor.version, descriptor.peers.size(), ring->ringSize(), descriptor.replication_factor);
        return RingPtr(std::move(ring));
    }

    Result<PeerPermutation> KetamaRing::getPeers(const BlockRef &key) const
    {
        if (_points.empty())
        {
            return {Status::PLACEMENT_QUERY_ERROR, "ketama ring has no placeable peers"};
        }

        PeerPermutation permutation;
        permutation.peers.reserve(_placeable);

        std::unordered_set<PeerId> seen;
        auto it = _points.lower_bound(key.hash());
        for (std::size_t visited = 0; visited < _points.size() && permutation.peers.size() < _placeable; ++visited)
        {
            if (it == _points.end())
                it = _points.begin(); // wrap
            if (seen.insert(it->second).second)
            {
                permutation.peers.push_back(it->second);
            }
            ++it;
        }

        permutation.replication = std::min(_descriptor.replication_factor, permutation.peers.size());
        return permutation;
    }

    std::size_t KetamaRing::pointsFor(const PeerId &id) const
    {
        return static_cast<std::size_t>(std::count_if(_points.begin(), _points.end(),
                                                      [&id](const auto &point)
                                                      { return point.second == id; }));
    }

    std::string KetamaRing::describe() const
    {
        std::ostringstream oss;
        oss << "Ring: Ketama\n";
        oss << "Version: " << _descriptor.version << "\n";
        oss << "Replication: " << _descriptor.replication_factor << "\n";
        oss << "Points: " << _points.size() << "\n";
        oss << "Peers:";
        for (const auto &peer : _descriptor.peers)
        {
            oss << "\n\t" << peer.id << " (" << peer.total_blocks << " blocks)";
        }
        return oss.str();
    }

    Result<Bytes> KetamaRing::marshal() const
    {
        return encodeRingDescriptor(_descriptor);
    }

    Result<RingPtr> KetamaRing::changeReplication(std::size_t factor) const
    {
        auto next = _descriptor;
        next.replication_factor = factor;
        next.version = _descriptor.version + 1;
        return create(next);
    }

    Result<RingPtr> KetamaRing::addPeers(const PeerInfoList &peers) const
    {
        auto next = _descriptor;
        next.peers = unionOf(_descriptor.peers, peers);
        next.version = _descriptor.version + 1;
        return create(next);
    }

    Result<RingPtr> KetamaRing::removePeers(const PeerList &peers) const
    {
        auto next = _descriptor;
        next.peers = difference(_descriptor.peers, peers);
        next.version = _descriptor.version + 1;
        return create(next);
    }
} // namespace blockring
