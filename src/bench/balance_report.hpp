#ifndef __BALANCE_REPORT_HPP__
#define __BALANCE_REPORT_HPP__

#include "../cluster/cluster_state.hpp"
#include "../cluster/rebalance_planner.hpp"
#include <cstdint>
#include <ostream>

namespace blockring
{
    struct BalanceSummary
    {
        std::size_t peers{0};
        std::uint64_t total{0};
        double mean{0.0};
        double stddev{0.0}; // population standard deviation of per-peer counts
    };

    [[nodiscard]] BalanceSummary summarizeBalance(const ClusterState &state);

    // Traffic an ideal rebalance would cause: the share of all replicas that
    // the changed peers account for.
    [[nodiscard]] std::uint64_t perfectTraffic(const RebalanceStats &stats, std::uint64_t block_size, int nodes, int delta);

    void printBalance(std::ostream &out, const ClusterState &state, std::uint64_t block_size);
    void printStats(std::ostream &out, const RebalanceStats &stats, std::uint64_t block_size, int nodes, int delta);
} // namespace blockring

#endif // __BALANCE_REPORT_HPP__
