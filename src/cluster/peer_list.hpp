#ifndef __PEER_LIST_HPP__
#define __PEER_LIST_HPP__

#include "../common/types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace blockring
{
    // Ordered peer ids. Where a list comes from a placement query the order is
    // the placement rank: position 0 is the primary holder.
    using PeerList = std::vector<PeerId>;

    // Returned by indexOf when the peer is absent. Compares greater than any
    // valid position.
    inline constexpr std::size_t PEER_NOT_FOUND = static_cast<std::size_t>(-1);

    [[nodiscard]] std::size_t indexOf(const PeerList &list, const PeerId &id) noexcept;
    [[nodiscard]] bool contains(const PeerList &list, const PeerId &id) noexcept;

    // a \ b, in a's order.
    [[nodiscard]] PeerList difference(const PeerList &a, const PeerList &b);

    // a followed by the members of b not in a, in b's order.
    [[nodiscard]] PeerList unionOf(const PeerList &a, const PeerList &b);

    // Members of a also in b, in a's order.
    [[nodiscard]] PeerList intersect(const PeerList &a, const PeerList &b);

    [[nodiscard]] std::string peerListToString(const PeerList &list);
} // namespace blockring

#endif // __PEER_LIST_HPP__
