#ifndef __CLUSTER_STATE_HPP__
#define __CLUSTER_STATE_HPP__

#include "block_ref.hpp"
#include "ring.hpp"
#include "../common/types.hpp"
#include <map>
#include <unordered_map>
#include <vector>

namespace blockring
{
    // Which blocks each peer holds. Every peer of the ring that produced the
    // state has an entry, possibly empty.
    class ClusterState
    {
    public:
        using Assignment = std::map<PeerId, std::vector<BlockRef>>;

        ClusterState() = default;

        // Empty entries for every member of the ring.
        [[nodiscard]] static ClusterState forMembers(const PeerList &members);

        // Places every block on the first `replication` peers the ring returns
        // for it. A failing placement query aborts the whole assignment.
        [[nodiscard]] static Result<ClusterState> assign(const std::vector<BlockRef> &blocks, const Ring &ring);

        void add(const PeerId &peer, const BlockRef &block) { _assignment[peer].push_back(block); }

        [[nodiscard]] const Assignment &assignment() const noexcept { return _assignment; }
        [[nodiscard]] PeerList peers() const;
        [[nodiscard]] const std::vector<BlockRef> &blocksFor(const PeerId &peer) const;
        [[nodiscard]] bool holds(const PeerId &peer, const BlockRef &block) const;

        // Number of (block, holder) pairs.
        [[nodiscard]] std::size_t totalReplicas() const noexcept;

        // Replica count of every block present in the state.
        [[nodiscard]] std::unordered_map<BlockRef, std::size_t> replicaCounts() const;

        [[nodiscard]] bool operator==(const ClusterState &other) const { return _assignment == other._assignment; }
        [[nodiscard]] bool operator!=(const ClusterState &other) const { return !(*this == other); }

    private:
        Assignment _assignment;
    };
} // namespace blockring

#endif // __CLUSTER_STATE_HPP__
