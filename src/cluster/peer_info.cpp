#include "peer_info.hpp"
#include "../common/logger.hpp"
#include <numeric>

namespace blockring
{
    std::size_t indexOf(const PeerInfoList &list, const PeerId &id) noexcept
    {
        for (std::size_t i = 0; i < list.size(); ++i)
        {
            if (list[i].id == id)
                return i;
        }
        return PEER_NOT_FOUND;
    }

    bool contains(const PeerInfoList &list, const PeerId &id) noexcept
    {
        return indexOf(list, id) != PEER_NOT_FOUND;
    }

    PeerInfoList difference(const PeerInfoList &list, const PeerList &b)
    {
        PeerInfoList out;
        for (const auto &peer : list)
        {
            if (!contains(b, peer.id))
                out.push_back(peer);
        }
        return out;
    }

    PeerInfoList unionOf(const PeerInfoList &a, const PeerInfoList &b)
    {
        PeerInfoList out(a);
        for (const auto &peer : b)
        {
            if (!contains(a, peer.id))
                out.push_back(peer);
        }
        return out;
    }

    PeerInfoList intersect(const PeerInfoList &a, const PeerInfoList &b)
    {
        PeerInfoList out;
        for (const auto &peer : a)
        {
            if (contains(b, peer.id))
                out.push_back(peer);
        }
        return out;
    }

    PeerList toPeerList(const PeerInfoList &list)
    {
        PeerList out;
        out.reserve(list.size());
        for (const auto &peer : list)
            out.push_back(peer.id);
        return out;
    }

    Result<PeerWeights> getWeights(const PeerInfoList &list)
    {
        PeerWeights out;
        if (list.empty())
        {
            return out;
        }

        std::uint64_t divisor = 0;
        for (const auto &peer : list)
        {
            divisor = std::gcd(divisor, peer.total_blocks);
        }
        if (divisor == 0)
        {
            LOG_ERROR("Cannot derive weights: all {} peers report zero capacity", list.size());
            return {Status::CAPACITY_WEIGHT_UNDEFINED, "all peer capacities are zero"};
        }

        for (const auto &peer : list)
        {
            out[peer.id] = peer.total_blocks / divisor;
            LOG_DEBUG("{}: weight {}", peer.id, out[peer.id]);
        }
        return out;
    }
} // namespace blockring
