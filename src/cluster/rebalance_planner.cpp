#include "rebalance_planner.hpp"
#include "../common/logger.hpp"

namespace blockring
{
    Result<PeerList> RebalancePlanner::holdersOf(const Ring &ring, const BlockRef &block, const PeerList &members) const
    {
        auto placement = ring.getPeers(block);
        if (!placement.ok())
        {
            return {placement.status(), placement.message()};
        }

        const auto &permutation = placement.value();
        if (permutation.peers.size() < permutation.replication)
        {
            return {Status::PLACEMENT_QUERY_ERROR,
                    "ring v" + std::to_string(ring.version()) + " returned fewer peers than its replication for " +
                        block.toString()};
        }

        auto holders = permutation.holders();
        for (const auto &peer : holders)
        {
            if (!contains(members, peer))
            {
                return {Status::PLACEMENT_QUERY_ERROR,
                        "ring v" + std::to_string(ring.version()) + " placed " + block.toString() +
                            " on non-member " + peer};
            }
        }
        return holders;
    }

    Result<RebalancePlan> RebalancePlanner::plan(const ClusterState &current) const
    {
        if (!_before || !_after)
        {
            return {Status::INVALID_ARGUMENT, "rebalance needs both rings"};
        }

        const auto old_members = _before->members();
        const auto new_members = _after->members();

        RebalancePlan result;
        result.next = ClusterState::forMembers(new_members);
        auto &stats = result.stats;

        for (const auto &[peer, blocks] : current.assignment())
        {
            for (const auto &block : blocks)
            {
                auto new_holders = holdersOf(*_after, block, new_members);
                if (!new_holders.ok())
                {
                    LOG_ERROR("Error in the new ring: {}", new_holders.describeError());
                    return {new_holders.status(), new_holders.message()};
                }
                auto old_holders = holdersOf(*_before, block, old_members);
                if (!old_holders.ok())
                {
                    LOG_ERROR("Error in the old ring: {}", old_holders.describeError());
                    return {old_holders.status(), old_holders.message()};
                }

                const auto &newpeers = new_holders.value();
                const auto &oldpeers = old_holders.value();
                const auto my_index = indexOf(oldpeers, peer);

                if (contains(newpeers, peer))
                {
                    result.next.add(peer, block);
                    ++stats.blocks_kept;
                }

                const auto diff = difference(newpeers, oldpeers);
                if (my_index >= diff.size())
                {
                    // Shrinking at this rank, or the peer is not an old holder.
                    continue;
                }

                if (my_index == oldpeers.size() - 1 && diff.size() > oldpeers.size())
                {
                    for (auto i = my_index; i < diff.size(); ++i)
                    {
                        result.next.add(diff[i], block);
                        ++stats.blocks_sent;
                    }
                }
                else
                {
                    result.next.add(diff[my_index], block);
                    ++stats.blocks_sent;
                }
            }
        }

        LOG_INFO("Rebalance v{} -> v{}: {} kept, {} sent ({}%)", _before->version(), _after->version(),
                 stats.blocks_kept, stats.blocks_sent, stats.percentSent());
        return std::move(result);
    }
} // namespace blockring
