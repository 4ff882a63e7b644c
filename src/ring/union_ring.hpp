#ifndef __UNION_RING_HPP__
#define __UNION_RING_HPP__

#include "ring_factory.hpp"

namespace blockring
{
    // Transitional ring used while data moves from one ring to the next: a
    // block is held by its old holders followed by any new holders they do not
    // already include.
    class UnionRing : public Ring
    {
    public:
        // Both sides must be present and neither may itself be a union ring.
        [[nodiscard]] static Result<RingPtr> create(RingPtr old_ring, RingPtr new_ring);

        [[nodiscard]] Result<PeerPermutation> getPeers(const BlockRef &key) const override;
        [[nodiscard]] PeerList members() const override;

        [[nodiscard]] std::string describe() const override;
        [[nodiscard]] RingType type() const noexcept override { return RingType::UNION; }
        [[nodiscard]] std::uint32_t version() const noexcept override { return _new->version(); }

        [[nodiscard]] Result<Bytes> marshal() const override;

        [[nodiscard]] const RingPtr &oldRing() const noexcept { return _old; }
        [[nodiscard]] const RingPtr &newRing() const noexcept { return _new; }

    private:
        UnionRing(RingPtr old_ring, RingPtr new_ring) : _old(std::move(old_ring)), _new(std::move(new_ring)) {}

        RingPtr _old;
        RingPtr _new;
    };
} // namespace blockring

#endif // __UNION_RING_HPP__
