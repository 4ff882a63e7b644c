#include "simulation.hpp"
#include "balance_report.hpp"
#include "workload.hpp"
#include "../cluster/cluster_state.hpp"
#include "../cluster/rebalance_planner.hpp"
#include "../common/logger.hpp"
#include "../ring/ring_factory.hpp"
#include <cstdio>

namespace blockring
{
    namespace
    {
        PeerInfoList slice(const PeerInfoList &peers, std::size_t begin, std::size_t end)
        {
            return PeerInfoList(peers.begin() + static_cast<std::ptrdiff_t>(begin),
                                peers.begin() + static_cast<std::ptrdiff_t>(end));
        }

        Result<RingPtr> applyReplication(const Config &config, RingPtr ring)
        {
            if (config.effectiveReplicationEnd() == config.getReplication())
            {
                return ring;
            }

            const auto *modifyable = asModifyableRing(*ring);
            if (modifyable == nullptr)
            {
                return {Status::NOT_FOUND, "ring does not support changing replication"};
            }
            return modifyable->changeReplication(config.effectiveReplicationEnd());
        }

        Result<RingPtr> mutateRing(const Config &config, const RingPtr &from, const PeerInfoList &peers)
        {
            const auto nodes = static_cast<std::size_t>(config.getNodes());
            const auto delta = config.getDelta();

            Result<RingPtr> to(Status::NOT_FOUND);
            if (delta > 0)
            {
                const auto *adder = asRingAdder(*from);
                if (adder == nullptr)
                {
                    LOG_WARN("Ring type {} cannot add peers; building the target ring from scratch",
                             ringTypeToString(from->type()));
                    return to;
                }
                to = adder->addPeers(slice(peers, nodes, peers.size()));
            }
            else
            {
                const auto *remover = asRingRemover(*from);
                if (remover == nullptr)
                {
                    LOG_WARN("Ring type {} cannot remove peers; building the target ring from scratch",
                             ringTypeToString(from->type()));
                    return to;
                }
                const auto keep = static_cast<std::size_t>(config.getNodes() + delta);
                to = remover->removePeers(toPeerList(slice(peers, keep, nodes)));
            }
            if (!to.ok())
            {
                return {to.status(), "changing ring membership: " + to.message()};
            }

            auto replicated = applyReplication(config, to.value());
            if (replicated.status() == Status::NOT_FOUND)
            {
                LOG_WARN("Ring type {} cannot change replication; building the target ring from scratch",
                         ringTypeToString(from->type()));
            }
            return replicated;
        }
    } // namespace

    PeerInfoList generatePeers(std::size_t count, std::uint64_t capacity, std::mt19937_64 &rng)
    {
        PeerInfoList peers;
        peers.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            const auto high = rng();
            const auto low = rng();
            char uuid[37];
            std::snprintf(uuid, sizeof(uuid), "%08x-%04x-4%03x-%04x-%012llx",
                          static_cast<unsigned>(high >> 32),
                          static_cast<unsigned>((high >> 16) & 0xffff),
                          static_cast<unsigned>(high & 0x0fff),
                          static_cast<unsigned>(((low >> 48) & 0x3fff) | 0x8000),
                          static_cast<unsigned long long>(low & 0xffffffffffffULL));
            peers.emplace_back(uuid, capacity);
        }
        return peers;
    }

    Result<RingPair> createRings(const Config &config, const PeerInfoList &peers)
    {
        const auto nodes = config.getNodes();
        const auto delta = config.getDelta();
        if (nodes < 0 || nodes + delta < 0)
        {
            return {Status::INVALID_ARGUMENT, "cannot remove more peers than the cluster starts with"};
        }
        const auto expected = static_cast<std::size_t>(delta > 0 ? nodes + delta : nodes);
        if (peers.size() != expected)
        {
            return {Status::INVALID_ARGUMENT,
                    "expected " + std::to_string(expected) + " peers, got " + std::to_string(peers.size())};
        }

        auto type = ringTypeFromString(config.getRingType());
        if (!type.ok())
        {
            return {type.status(), type.message()};
        }

        RingDescriptor start;
        start.type = type.value();
        start.version = 1;
        start.replication_factor = config.getReplication();
        start.peers = slice(peers, 0, static_cast<std::size_t>(nodes));

        auto from = createRing(start);
        if (!from.ok())
        {
            return {from.status(), "creating from-ring: " + from.message()};
        }

        auto mutated = mutateRing(config, from.value(), peers);
        if (mutated.ok())
        {
            return RingPair{from.value(), mutated.value()};
        }
        if (mutated.status() != Status::NOT_FOUND)
        {
            return {mutated.status(), mutated.message()};
        }

        RingDescriptor target;
        target.type = type.value();
        target.version = 2;
        target.replication_factor = config.effectiveReplicationEnd();
        target.peers = slice(peers, 0, static_cast<std::size_t>(nodes + delta));

        auto to = createRing(target);
        if (!to.ok())
        {
            return {to.status(), "creating to-ring: " + to.message()};
        }
        return RingPair{from.value(), to.value()};
    }

    Status runSimulation(const Config &config, std::ostream &out)
    {
        auto block_size = config.blockSizeBytes();
        if (!block_size.ok())
        {
            LOG_ERROR("error parsing block-size: {}", block_size.describeError());
            return block_size.status();
        }
        auto total_data = config.totalDataBytes();
        if (!total_data.ok())
        {
            LOG_ERROR("error parsing total-data: {}", total_data.describeError());
            return total_data.status();
        }

        std::mt19937_64 rng(config.getSeed());
        const auto nodes = config.getNodes();
        const auto delta = config.getDelta();
        const auto peer_count = static_cast<std::size_t>(delta > 0 ? nodes + delta : nodes);
        const auto peers = generatePeers(peer_count, config.getPeerCapacity(), rng);

        const auto block_count = static_cast<std::size_t>(total_data.value() / block_size.value());
        WorkloadGenerator generator(rng, static_cast<double>(config.getRewriteEdge()) / 100.0);
        const auto blocks = generator.generate(block_count);

        auto rings = createRings(config, peers);
        if (!rings.ok())
        {
            LOG_ERROR("error creating rings: {}", rings.describeError());
            return rings.status();
        }
        const auto &[from, to] = rings.value();
        LOG_DEBUG("From ring:\n{}", from->describe());
        LOG_DEBUG("To ring:\n{}", to->describe());

        out << "Unique blocks: " << blocks.size() << "\n";
        auto cluster = ClusterState::assign(blocks, *from);
        if (!cluster.ok())
        {
            LOG_ERROR("error in the ring: {}", cluster.describeError());
            return cluster.status();
        }

        out << "@START *****\n";
        printBalance(out, cluster.value(), block_size.value());

        RebalancePlanner planner(from, to);
        auto plan = planner.plan(cluster.value());
        if (!plan.ok())
        {
            LOG_ERROR("error planning rebalance: {}", plan.describeError());
            return plan.status();
        }

        out << "@END *****\n";
        printBalance(out, plan.value().next, block_size.value());
        out << "Changes:\n";
        printStats(out, plan.value().stats, block_size.value(), nodes, delta);
        return Status::OK;
    }
} // namespace blockring
