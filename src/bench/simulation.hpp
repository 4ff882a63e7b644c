#ifndef __SIMULATION_HPP__
#define __SIMULATION_HPP__

#include "../cluster/ring.hpp"
#include "../common/config.hpp"
#include <ostream>
#include <random>
#include <utility>

namespace blockring
{
    struct RingPair
    {
        RingPtr from;
        RingPtr to;
    };

    // UUID-formatted peer ids drawn from rng, each with `capacity` blocks.
    [[nodiscard]] PeerInfoList generatePeers(std::size_t count, std::uint64_t capacity, std::mt19937_64 &rng);

    // Builds the ring before and after the topology change described by
    // config. `peers` holds nodes + max(delta, 0) descriptors. The change is
    // applied through the ring's own mutation capabilities when it has them;
    // otherwise a fresh ring is constructed for the target topology.
    [[nodiscard]] Result<RingPair> createRings(const Config &config, const PeerInfoList &peers);

    // Generates the workload, assigns it against the old ring, plans the
    // rebalance and writes the report to out.
    [[nodiscard]] Status runSimulation(const Config &config, std::ostream &out);
} // namespace blockring

#endif // __SIMULATION_HPP__
