#ifndef __RING_FACTORY_HPP__
#define __RING_FACTORY_HPP__

#include "../cluster/ring.hpp"
#include <cstdint>

namespace blockring
{
    // Serializable description of a ring built from a membership list.
    struct RingDescriptor
    {
        RingType type{RingType::EMPTY};
        std::uint32_t version{0};
        std::size_t replication_factor{0};
        PeerInfoList peers;
    };

    [[nodiscard]] Result<RingPtr> createRing(const RingDescriptor &descriptor);

    // Reverses Ring::marshal(). Corrupt or truncated input is INVALID_REQUEST.
    [[nodiscard]] Result<RingPtr> unmarshalRing(const Bytes &data);

    // Shared membership checks for rings that need at least one member, unique
    // ids and a replication factor of at least one.
    [[nodiscard]] Status validateMembership(const RingDescriptor &descriptor, std::string &reason);
} // namespace blockring

#endif // __RING_FACTORY_HPP__
