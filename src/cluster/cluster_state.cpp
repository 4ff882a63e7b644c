#include "cluster_state.hpp"
#include "../common/logger.hpp"
#include <algorithm>

namespace blockring
{
    ClusterState ClusterState::forMembers(const PeerList &members)
    {
        ClusterState state;
        for (const auto &peer : members)
        {
            state._assignment[peer];
        }
        return state;
    }

    Result<ClusterState> ClusterState::assign(const std::vector<BlockRef> &blocks, const Ring &ring)
    {
        const auto members = ring.members();
        auto state = forMembers(members);

        for (const auto &block : blocks)
        {
            auto placement = ring.getPeers(block);
            if (!placement.ok())
            {
                LOG_ERROR("Error in the ring while assigning {}: {}", block.toString(), placement.describeError());
                return {placement.status(), placement.message()};
            }

            const auto &permutation = placement.value();
            if (permutation.peers.size() < permutation.replication)
            {
                const auto reason = "ring returned " + std::to_string(permutation.peers.size()) +
                                    " peers for replication " + std::to_string(permutation.replication) +
                                    " of " + block.toString();
                LOG_ERROR("Error in the ring while assigning {}: {}", block.toString(), reason);
                return {Status::PLACEMENT_QUERY_ERROR, reason};
            }

            for (const auto &peer : permutation.holders())
            {
                if (!contains(members, peer))
                {
                    const auto reason = "ring placed " + block.toString() + " on non-member " + peer;
                    LOG_ERROR("Error in the ring while assigning {}: {}", block.toString(), reason);
                    return {Status::PLACEMENT_QUERY_ERROR, reason};
                }
                state.add(peer, block);
            }
        }

        LOG_DEBUG("Assigned {} blocks as {} replicas over {} peers", blocks.size(), state.totalReplicas(), members.size());
        return std::move(state);
    }

    PeerList ClusterState::peers() const
    {
        PeerList out;
        out.reserve(_assignment.size());
        for (const auto &entry : _assignment)
            out.push_back(entry.first);
        return out;
    }

    const std::vector<BlockRef> &ClusterState::blocksFor(const PeerId &peer) const
    {
        static const std::vector<BlockRef> none;
        const auto it = _assignment.find(peer);
        return it == _assignment.end() ? none : it->second;
    }

    bool ClusterState::holds(const PeerId &peer, const BlockRef &block) const
    {
        const auto &blocks = blocksFor(peer);
        return std::find(blocks.begin(), blocks.end(), block) != blocks.end();
    }

    std::size_t ClusterState::totalReplicas() const noexcept
    {
        std::size_t total = 0;
        for (const auto &entry : _assignment)
            total += entry.second.size();
        return total;
    }

    std::unordered_map<BlockRef, std::size_t> ClusterState::replicaCounts() const
    {
        std::unordered_map<BlockRef, std::size_t> counts;
        for (const auto &entry : _assignment)
        {
            for (const auto &block : entry.second)
                ++counts[block];
        }
        return counts;
    }
} // namespace blockring
