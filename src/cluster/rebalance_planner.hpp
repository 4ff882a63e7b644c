#ifndef __REBALANCE_PLANNER_HPP__
#define __REBALANCE_PLANNER_HPP__

#include "cluster_state.hpp"
#include "ring.hpp"
#include <cstdint>
#include <memory>

namespace blockring
{
    struct RebalanceStats
    {
        // Replica slots that stay on their current peer.
        std::uint64_t blocks_kept{0};
        // Replica slots that have to be transmitted to a new holder.
        std::uint64_t blocks_sent{0};

        [[nodiscard]] std::uint64_t total() const noexcept { return blocks_kept + blocks_sent; }
        [[nodiscard]] double percentSent() const noexcept
        {
            return total() == 0 ? 0.0 : static_cast<double>(blocks_sent) * 100.0 / static_cast<double>(total());
        }
    };

    struct RebalancePlan
    {
        ClusterState next;
        RebalanceStats stats;
    };

    // Computes where every replica goes when the cluster moves from one ring
    // to another.
    //
    // A holder keeps its replica if the new ring still lists it. Separately,
    // the holder at old rank i forwards the block to the i-th peer that the new
    // ring lists but the old one did not; when the new holders outnumber the
    // old ones, the last old holder also forwards to every remaining new peer.
    // Holders whose rank has no new counterpart forward nothing.
    //
    // The rank correspondence relies on rings keeping their permutations stable
    // under small edits. If `current` lacks a holder the old ring expects, the
    // new peer at that holder's rank never receives the block; the planner
    // does not repair such under-replication.
    class RebalancePlanner
    {
    public:
        RebalancePlanner(RingPtr before, RingPtr after)
            : _before(std::move(before)), _after(std::move(after)) {}

        // `current` must have been produced against the old ring. Any placement
        // error aborts the pass; no partial plan is returned.
        [[nodiscard]] Result<RebalancePlan> plan(const ClusterState &current) const;

    private:
        RingPtr _before;
        RingPtr _after;

        [[nodiscard]] Result<PeerList> holdersOf(const Ring &ring, const BlockRef &block, const PeerList &members) const;
    };
} // namespace blockring

#endif // __REBALANCE_PLANNER_HPP__
