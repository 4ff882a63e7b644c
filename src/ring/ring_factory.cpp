#include "ring_factory.hpp"
#include "empty_ring.hpp"
#include "ketama_ring.hpp"
#include "mod_ring.hpp"
#include "ring_codec.hpp"
#include "single_ring.hpp"
#include "union_ring.hpp"
#include "../common/logger.hpp"
#include <unordered_set>

namespace blockring
{
    Status validateMembership(const RingDescriptor &descriptor, std::string &reason)
    {
        if (descriptor.replication_factor < 1)
        {
            reason = "replication factor must be at least 1";
            return Status::RING_CONSTRUCTION_ERROR;
        }
        if (descriptor.peers.empty())
        {
            reason = "ring needs at least one peer";
            return Status::RING_CONSTRUCTION_ERROR;
        }

        std::unordered_set<PeerId> ids;
        for (const auto &peer : descriptor.peers)
        {
            if (peer.id.empty())
            {
                reason = "peer with empty id";
                return Status::RING_CONSTRUCTION_ERROR;
            }
            if (!ids.insert(peer.id).second)
            {
                reason = "duplicate peer " + peer.id;
                return Status::RING_CONSTRUCTION_ERROR;
            }
        }
        return Status::OK;
    }

    Result<RingPtr> createRing(const RingDescriptor &descriptor)
    {
        switch (descriptor.type)
        {
        case RingType::EMPTY:
            if (!descriptor.peers.empty())
            {
                return {Status::RING_CONSTRUCTION_ERROR, "empty ring cannot have peers"};
            }
            return RingPtr(std::make_shared<EmptyRing>(descriptor.version));
        case RingType::SINGLE:
            return SingleRing::create(descriptor);
        case RingType::MOD:
            return ModRing::create(descriptor);
        case RingType::KETAMA:
            return KetamaRing::create(descriptor);
        case RingType::UNION:
            return {Status::RING_CONSTRUCTION_ERROR, "a union ring is built from two rings, not a peer list"};
        default:
            return {Status::UNKNOWN_RING_KIND,
                    "unknown ring type id " + std::to_string(static_cast<int>(descriptor.type))};
        }
    }

    namespace
    {
        Result<RingPtr> decodeRing(RingDecoder &decoder, bool inside_union)
        {
            auto type = decoder.readHeader();
            if (!type.ok())
            {
                LOG_ERROR("Cannot decode ring: {}", type.message());
                return {type.status(), type.message()};
            }

            if (type.value() == RingType::UNION)
            {
                if (inside_union)
                {
                    LOG_ERROR("Cannot decode ring: union ring nested in a union ring");
                    return {Status::INVALID_REQUEST, "nested union ring"};
                }

                RingDecoder old_section(nullptr, 0);
                RingDecoder new_section(nullptr, 0);
                if (decoder.getSection(old_section) != Status::OK || decoder.getSection(new_section) != Status::OK ||
                    !decoder.atEnd())
                {
                    return {Status::INVALID_REQUEST, "malformed union ring"};
                }
                auto old_ring = decodeRing(old_section, true);
                if (!old_ring.ok())
                {
                    return old_ring;
                }
                auto new_ring = decodeRing(new_section, true);
                if (!new_ring.ok())
                {
                    return new_ring;
                }
                return UnionRing::create(old_ring.value(), new_ring.value());
            }

            auto descriptor = decodeRingDescriptor(decoder, type.value());
            if (!descriptor.ok())
            {
                return {descriptor.status(), descriptor.message()};
            }
            if (!decoder.atEnd())
            {
                return {Status::INVALID_REQUEST, "trailing bytes after ring descriptor"};
            }
            return createRing(descriptor.value());
        }
    } // namespace

    Result<RingPtr> unmarshalRing(const Bytes &data)
    {
        RingDecoder decoder(data);
        return decodeRing(decoder, false);
    }
} // namespace blockring
