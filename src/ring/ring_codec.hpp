#ifndef __RING_CODEC_HPP__
#define __RING_CODEC_HPP__

#include "ring_factory.hpp"
#include "../common/types.hpp"
#include <cstdint>
#include <string>

namespace blockring
{
    // Layout: magic, format version, ring type, then a type-specific body.
    // Descriptor-backed rings write version, replication and the peer list;
    // composite rings write their parts as nested length-prefixed encodings.
    // Integers are big-endian.
    class RingEncoder
    {
    public:
        explicit RingEncoder(RingType type);

        void putU32(std::uint32_t value);
        void putU64(std::uint64_t value);
        void putString(const std::string &value);
        void putBytes(const Bytes &value);

        [[nodiscard]] Bytes release() noexcept { return std::move(_buffer); }

        static constexpr std::uint32_t MAGIC_NUMBER = 0x52494E47; // "RING"
        static constexpr std::uint8_t FORMAT_VERSION = 1;

    private:
        Bytes _buffer;

        void append(const void *data, std::size_t size);
        void appendBigEndian(std::uint64_t value, std::size_t width);
    };

    class RingDecoder
    {
    public:
        explicit RingDecoder(const Bytes &data) : _data(data.data()), _size(data.size()) {}
        RingDecoder(const std::uint8_t *data, std::size_t size) : _data(data), _size(size) {}

        // Validates magic and format version and returns the ring type.
        [[nodiscard]] Result<RingType> readHeader();

        [[nodiscard]] Status getU32(std::uint32_t &value);
        [[nodiscard]] Status getU64(std::uint64_t &value);
        [[nodiscard]] Status getString(std::string &value);

        // Consumes a length-prefixed nested encoding and points `section` at it
        // without copying. `section` must not outlive the decoded buffer.
        [[nodiscard]] Status getSection(RingDecoder &section);

        [[nodiscard]] bool atEnd() const noexcept { return _offset == _size; }

    private:
        const std::uint8_t *_data;
        std::size_t _size;
        std::size_t _offset = 0;

        [[nodiscard]] Status take(void *out, std::size_t size);
        [[nodiscard]] Status takeBigEndian(std::uint64_t &value, std::size_t width);
    };

    [[nodiscard]] Result<Bytes> encodeRingDescriptor(const RingDescriptor &descriptor);

    // Reads the body that follows the header for a descriptor-backed ring.
    [[nodiscard]] Result<RingDescriptor> decodeRingDescriptor(RingDecoder &decoder, RingType type);
} // namespace blockring

#endif // __RING_CODEC_HPP__
