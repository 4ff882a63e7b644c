#ifndef __BLOCK_REF_HPP__
#define __BLOCK_REF_HPP__

#include "../common/types.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <tuple>

namespace blockring
{
    // Identity of one block of one file: the same BlockRef names the same
    // logical block under every ring version.
    struct BlockRef
    {
        VolumeId volume{0};
        INodeId inode{0};
        IndexId index{0};

        static constexpr std::size_t ENCODED_SIZE = 3 * sizeof(std::uint64_t);

        BlockRef() = default;
        BlockRef(VolumeId volume, INodeId inode, IndexId index) : volume(volume), inode(inode), index(index) {}

        // 24 bytes, big-endian volume, inode, index.
        [[nodiscard]] std::array<std::uint8_t, ENCODED_SIZE> toBytes() const noexcept;

        // Stable across processes and platforms; rings place blocks by it.
        [[nodiscard]] std::uint64_t hash() const noexcept;

        [[nodiscard]] std::string toString() const;

        [[nodiscard]] bool operator==(const BlockRef &other) const noexcept
        {
            return volume == other.volume && inode == other.inode && index == other.index;
        }
        [[nodiscard]] bool operator!=(const BlockRef &other) const noexcept { return !(*this == other); }
        [[nodiscard]] bool operator<(const BlockRef &other) const noexcept
        {
            return std::tie(volume, inode, index) < std::tie(other.volume, other.inode, other.index);
        }
    };

    // FNV-1a finished with splitmix64. Shared by every ring that hashes ids.
    [[nodiscard]] std::uint64_t stableHash(const std::uint8_t *data, std::size_t size) noexcept;
    [[nodiscard]] std::uint64_t stableHash(const std::string &s) noexcept;
} // namespace blockring

namespace std
{
    template <>
    struct hash<blockring::BlockRef>
    {
        std::size_t operator()(const blockring::BlockRef &ref) const noexcept
        {
            return static_cast<std::size_t>(ref.hash());
        }
    };
} // namespace std

#endif // __BLOCK_REF_HPP__
