#ifndef __PEER_INFO_HPP__
#define __PEER_INFO_HPP__

#include "peer_list.hpp"
#include "../common/types.hpp"
#include <cstdint>
#include <map>
#include <vector>

namespace blockring
{
    // A storage peer as observed from cluster membership.
    struct PeerInfo
    {
        PeerId id;
        std::uint64_t total_blocks{0};

        PeerInfo() = default;
        PeerInfo(PeerId id, std::uint64_t total_blocks) : id(std::move(id)), total_blocks(total_blocks) {}

        [[nodiscard]] bool operator==(const PeerInfo &other) const noexcept
        {
            return id == other.id && total_blocks == other.total_blocks;
        }
        [[nodiscard]] bool operator!=(const PeerInfo &other) const noexcept { return !(*this == other); }
    };

    // Insertion-ordered peer descriptors. Set operations compare by id.
    using PeerInfoList = std::vector<PeerInfo>;

    using PeerWeights = std::map<PeerId, std::uint64_t>;

    [[nodiscard]] std::size_t indexOf(const PeerInfoList &list, const PeerId &id) noexcept;
    [[nodiscard]] bool contains(const PeerInfoList &list, const PeerId &id) noexcept;

    // Descriptors whose id is not in b, in list order.
    [[nodiscard]] PeerInfoList difference(const PeerInfoList &list, const PeerList &b);
    [[nodiscard]] PeerInfoList unionOf(const PeerInfoList &a, const PeerInfoList &b);
    [[nodiscard]] PeerInfoList intersect(const PeerInfoList &a, const PeerInfoList &b);

    [[nodiscard]] PeerList toPeerList(const PeerInfoList &list);

    // Integer placement weight per peer: total_blocks divided by the GCD of all
    // capacities. Empty input gives an empty map. Fails with
    // CAPACITY_WEIGHT_UNDEFINED when every capacity is zero.
    [[nodiscard]] Result<PeerWeights> getWeights(const PeerInfoList &list);
} // namespace blockring

#endif // __PEER_INFO_HPP__
