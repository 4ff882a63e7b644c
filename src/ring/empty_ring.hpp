#ifndef __EMPTY_RING_HPP__
#define __EMPTY_RING_HPP__

#include "ring_factory.hpp"

namespace blockring
{
    // A ring with no members. Every placement query fails.
    class EmptyRing : public Ring
    {
    public:
        explicit EmptyRing(std::uint32_t version) : _version(version) {}

        [[nodiscard]] Result<PeerPermutation> getPeers(const BlockRef &key) const override;
        [[nodiscard]] PeerList members() const override { return {}; }

        [[nodiscard]] std::string describe() const override;
        [[nodiscard]] RingType type() const noexcept override { return RingType::EMPTY; }
        [[nodiscard]] std::uint32_t version() const noexcept override { return _version; }

        [[nodiscard]] Result<Bytes> marshal() const override;

    private:
        std::uint32_t _version;
    };
} // namespace blockring

#endif // __EMPTY_RING_HPP__
