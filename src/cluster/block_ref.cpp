#include "block_ref.hpp"
#include <sstream>

namespace blockring
{
    namespace
    {
        constexpr std::uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
        constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

        std::uint64_t splitmix64(std::uint64_t x) noexcept
        {
            x += 0x9e3779b97f4a7c15ULL;
            x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
            x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
            x = x ^ (x >> 31);
            return x;
        }

        void putBigEndian(std::uint8_t *out, std::uint64_t value) noexcept
        {
            for (int i = 7; i >= 0; --i)
            {
                out[i] = static_cast<std::uint8_t>(value & 0xff);
                value >>= 8;
            }
        }
    } // namespace

    std::uint64_t stableHash(const std::uint8_t *data, std::size_t size) noexcept
    {
        std::uint64_t h = FNV_OFFSET_BASIS;
        for (std::size_t i = 0; i < size; ++i)
        {
            h ^= data[i];
            h *= FNV_PRIME;
        }
        return splitmix64(h);
    }

    std::uint64_t stableHash(const std::string &s) noexcept
    {
        return stableHash(reinterpret_cast<const std::uint8_t *>(s.data()), s.size());
    }

    std::array<std::uint8_t, BlockRef::ENCODED_SIZE> BlockRef::toBytes() const noexcept
    {
        std::array<std::uint8_t, ENCODED_SIZE> out{};
        putBigEndian(out.data(), volume);
        putBigEndian(out.data() + 8, inode);
        putBigEndian(out.data() + 16, index);
        return out;
    }

    std::uint64_t BlockRef::hash() const noexcept
    {
        const auto bytes = toBytes();
        return stableHash(bytes.data(), bytes.size());
    }

    std::string BlockRef::toString() const
    {
        std::ostringstream oss;
        oss << volume << ":" << inode << ":" << index;
        return oss.str();
    }
} // namespace blockring
