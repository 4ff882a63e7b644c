#include "empty_ring.hpp"
#include "ring_codec.hpp"

namespace blockring
{
    Result<PeerPermutation> EmptyRing::getPeers(const BlockRef &key) const
    {
        return {Status::PLACEMENT_QUERY_ERROR, "empty ring has no peers for block " + key.toString()};
    }

    std::string EmptyRing::describe() const
    {
        return "Ring: Empty\nVersion: " + std::to_string(_version);
    }

    Result<Bytes> EmptyRing::marshal() const
    {
        RingDescriptor descriptor;
        descriptor.type = RingType::EMPTY;
        descriptor.version = _version;
        return encodeRingDescriptor(descriptor);
    }
} // namespace blockring
