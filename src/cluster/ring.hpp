#ifndef __RING_HPP__
#define __RING_HPP__

#include "block_ref.hpp"
#include "peer_info.hpp"
#include "peer_list.hpp"
#include "../common/types.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace blockring
{
    enum class RingType : std::uint8_t
    {
        EMPTY = 0,
        SINGLE = 1,
        MOD = 2,
        UNION = 3,
        KETAMA = 4
    };

    [[nodiscard]] std::string ringTypeToString(RingType type);
    [[nodiscard]] Result<RingType> ringTypeFromString(const std::string &name);

    // Answer of a placement query. The first `replication` peers hold the
    // block; the rest, if any, are the order in which further replicas would
    // be placed.
    struct PeerPermutation
    {
        std::size_t replication{0};
        PeerList peers;

        // The effective holders: peers truncated to the replication factor.
        [[nodiscard]] PeerList holders() const
        {
            const auto n = replication < peers.size() ? replication : peers.size();
            return PeerList(peers.begin(), peers.begin() + static_cast<std::ptrdiff_t>(n));
        }

        [[nodiscard]] bool operator==(const PeerPermutation &other) const
        {
            return replication == other.replication && peers == other.peers;
        }
        [[nodiscard]] bool operator!=(const PeerPermutation &other) const { return !(*this == other); }
    };

    class Ring;
    using RingPtr = std::shared_ptr<const Ring>;

    // Immutable snapshot of a topology. Every method is const and safe to call
    // from several threads at once; topology changes produce a new Ring.
    class Ring
    {
    public:
        virtual ~Ring() = default;

        // Deterministic for a given ring version. If the ring has fewer members
        // than its replication factor the returned replication is capped to the
        // member count.
        [[nodiscard]] virtual Result<PeerPermutation> getPeers(const BlockRef &key) const = 0;
        [[nodiscard]] virtual PeerList members() const = 0;

        [[nodiscard]] virtual std::string describe() const = 0;
        [[nodiscard]] virtual RingType type() const noexcept = 0;
        [[nodiscard]] virtual std::uint32_t version() const noexcept = 0;

        [[nodiscard]] virtual Result<Bytes> marshal() const = 0;
    };

    // Optional capabilities. Probe with the as* helpers below before use; a
    // ring that lacks one simply does not derive from it.
    class ModifyableRing
    {
    public:
        virtual ~ModifyableRing() = default;

        // Same membership, new replication factor.
        [[nodiscard]] virtual Result<RingPtr> changeReplication(std::size_t factor) const = 0;
    };

    class RingAdder : public virtual ModifyableRing
    {
    public:
        // Membership becomes members() followed by the new peers; peers already
        // present are ignored.
        [[nodiscard]] virtual Result<RingPtr> addPeers(const PeerInfoList &peers) const = 0;
    };

    class RingRemover : public virtual ModifyableRing
    {
    public:
        // Membership becomes members() minus peers.
        [[nodiscard]] virtual Result<RingPtr> removePeers(const PeerList &peers) const = 0;
    };

    [[nodiscard]] inline const ModifyableRing *asModifyableRing(const Ring &ring) noexcept
    {
        return dynamic_cast<const ModifyableRing *>(&ring);
    }

    [[nodiscard]] inline const RingAdder *asRingAdder(const Ring &ring) noexcept
    {
        return dynamic_cast<const RingAdder *>(&ring);
    }

    [[nodiscard]] inline const RingRemover *asRingRemover(const Ring &ring) noexcept
    {
        return dynamic_cast<const RingRemover *>(&ring);
    }
} // namespace blockring

#endif // __RING_HPP__
