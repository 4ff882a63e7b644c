#include "peer_list.hpp"
#include <sstream>

namespace blockring
{
    std::size_t indexOf(const PeerList &list, const PeerId &id) noexcept
    {
        for (std::size_t i = 0; i < list.size(); ++i)
        {
            if (list[i] == id)
                return i;
        }
        return PEER_NOT_FOUND;
    }

    bool contains(const PeerList &list, const PeerId &id) noexcept
    {
        return indexOf(list, id) != PEER_NOT_FOUND;
    }

    PeerList difference(const PeerList &a, const PeerList &b)
    {
        PeerList out;
        for (const auto &id : a)
        {
            if (!contains(b, id))
                out.push_back(id);
        }
        return out;
    }

    PeerList unionOf(const PeerList &a, const PeerList &b)
    {
        PeerList out(a);
        for (const auto &id : b)
        {
            if (!contains(a, id))
                out.push_back(id);
        }
        return out;
    }

    PeerList intersect(const PeerList &a, const PeerList &b)
    {
        PeerList out;
        for (const auto &id : a)
        {
            if (contains(b, id))
                out.push_back(id);
        }
        return out;
    }

    std::string peerListToString(const PeerList &list)
    {
        std::ostringstream oss;
        oss << "[";
        for (std::size_t i = 0; i < list.size(); ++i)
        {
            if (i > 0)
                oss << ", ";
            oss << list[i];
        }
        oss << "]";
        return oss.str();
    }
} // namespace blockring
