#include "balance_report.hpp"
#include "../common/units.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace blockring
{
    BalanceSummary summarizeBalance(const ClusterState &state)
    {
        BalanceSummary summary;
        summary.peers = state.assignment().size();
        if (summary.peers == 0)
        {
            return summary;
        }

        for (const auto &entry : state.assignment())
        {
            summary.total += entry.second.size();
        }
        summary.mean = static_cast<double>(summary.total) / static_cast<double>(summary.peers);

        double variance = 0.0;
        for (const auto &entry : state.assignment())
        {
            const auto delta = static_cast<double>(entry.second.size()) - summary.mean;
            variance += delta * delta;
        }
        summary.stddev = std::sqrt(variance / static_cast<double>(summary.peers));
        return summary;
    }

    std::uint64_t perfectTraffic(const RebalanceStats &stats, std::uint64_t block_size, int nodes, int delta)
    {
        const auto final_nodes = nodes + delta;
        if (final_nodes == 0)
        {
            return 0;
        }
        const auto total = static_cast<double>(stats.total() * block_size);
        return static_cast<std::uint64_t>(total * std::fabs(static_cast<double>(delta) / static_cast<double>(final_nodes)));
    }

    void printBalance(std::ostream &out, const ClusterState &state, std::uint64_t block_size)
    {
        out << "Balance:\n";
        for (const auto &[peer, blocks] : state.assignment())
        {
            out << "\t" << peer << ": " << blocks.size() << "\n";
        }

        const auto summary = summarizeBalance(state);
        out << "Total: " << formatIBytes(summary.total * block_size)
            << ", Mean: " << formatIBytes(static_cast<std::uint64_t>(summary.mean) * block_size)
            << ", Stddev: " << formatIBytes(static_cast<std::uint64_t>(summary.stddev) * block_size) << "\n";
    }

    void printStats(std::ostream &out, const RebalanceStats &stats, std::uint64_t block_size, int nodes, int delta)
    {
        out << "Blocks Kept: " << stats.blocks_kept << "\n";
        out << "Blocks Sent: " << stats.blocks_sent << "\n";
        std::ostringstream percent;
        percent << std::fixed << std::setprecision(2) << stats.percentSent();
        out << "Percentage Sent: " << percent.str() << "\n";
        out << "Network Traffic: " << formatIBytes(stats.blocks_sent * block_size) << "\n";
        out << "Perfect Traffic: " << formatIBytes(perfectTraffic(stats, block_size, nodes, delta)) << "\n";
    }
} // namespace blockring
