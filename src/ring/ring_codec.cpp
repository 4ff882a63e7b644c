#include "ring_codec.hpp"
#include <cstring>
#include <limits>

namespace blockring
{
    RingEncoder::RingEncoder(RingType type)
    {
        putU32(MAGIC_NUMBER);
        _buffer.push_back(FORMAT_VERSION);
        _buffer.push_back(static_cast<std::uint8_t>(type));
    }

    void RingEncoder::append(const void *data, std::size_t size)
    {
        const auto bytes = static_cast<const std::uint8_t *>(data);
        _buffer.insert(_buffer.end(), bytes, bytes + size);
    }

    void RingEncoder::appendBigEndian(std::uint64_t value, std::size_t width)
    {
        for (std::size_t i = width; i > 0; --i)
        {
            _buffer.push_back(static_cast<std::uint8_t>((value >> (8 * (i - 1))) & 0xff));
        }
    }

    void RingEncoder::putU32(std::uint32_t value)
    {
        appendBigEndian(value, sizeof(value));
    }

    void RingEncoder::putU64(std::uint64_t value)
    {
        appendBigEndian(value, sizeof(value));
    }

    void RingEncoder::putString(const std::string &value)
    {
        putU32(static_cast<std::uint32_t>(value.size()));
        append(value.data(), value.size());
    }

    void RingEncoder::putBytes(const Bytes &value)
    {
        putU32(static_cast<std::uint32_t>(value.size()));
        append(value.data(), value.size());
    }

    Status RingDecoder::take(void *out, std::size_t size)
    {
        if (size > _size - _offset)
        {
            return Status::INVALID_REQUEST;
        }
        std::memcpy(out, _data + _offset, size);
        _offset += size;
        return Status::OK;
    }

    Status RingDecoder::takeBigEndian(std::uint64_t &value, std::size_t width)
    {
        if (width > _size - _offset)
        {
            return Status::INVALID_REQUEST;
        }
        value = 0;
        for (std::size_t i = 0; i < width; ++i)
        {
            value = (value << 8) | _data[_offset + i];
        }
        _offset += width;
        return Status::OK;
    }

    Result<RingType> RingDecoder::readHeader()
    {
        std::uint32_t magic = 0;
        if (getU32(magic) != Status::OK || magic != RingEncoder::MAGIC_NUMBER)
        {
            return {Status::INVALID_REQUEST, "not a serialized ring"};
        }

        std::uint8_t header[2];
        if (take(header, sizeof(header)) != Status::OK)
        {
            return {Status::INVALID_REQUEST, "truncated ring header"};
        }
        if (header[0] != RingEncoder::FORMAT_VERSION)
        {
            return {Status::INVALID_REQUEST, "unsupported ring format version " + std::to_string(header[0])};
        }
        if (header[1] > static_cast<std::uint8_t>(RingType::KETAMA))
        {
            return {Status::UNKNOWN_RING_KIND, "unknown ring type id " + std::to_string(header[1])};
        }
        return static_cast<RingType>(header[1]);
    }

    Status RingDecoder::getU32(std::uint32_t &value)
    {
        std::uint64_t wide = 0;
        const auto status = takeBigEndian(wide, sizeof(value));
        value = static_cast<std::uint32_t>(wide);
        return status;
    }

    Status RingDecoder::getU64(std::uint64_t &value)
    {
        return takeBigEndian(value, sizeof(value));
    }

    Status RingDecoder::getString(std::string &value)
    {
        std::uint32_t size = 0;
        if (getU32(size) != Status::OK || size > _size - _offset)
        {
            return Status::INVALID_REQUEST;
        }
        value.assign(reinterpret_cast<const char *>(_data + _offset), size);
        _offset += size;
        return Status::OK;
    }

    Status RingDecoder::getSection(RingDecoder &section)
    {
        std::uint32_t size = 0;
        if (getU32(size) != Status::OK || size > _size - _offset)
        {
            return Status::INVALID_REQUEST;
        }
        section = RingDecoder(_data + _offset, size);
        _offset += size;
        return Status::OK;
    }

    Result<Bytes> encodeRingDescriptor(const RingDescriptor &descriptor)
    {
        if (descriptor.replication_factor > std::numeric_limits<std::uint32_t>::max() ||
            descriptor.peers.size() > std::numeric_limits<std::uint32_t>::max())
        {
            return {Status::INVALID_ARGUMENT, "ring too large to serialize"};
        }

        RingEncoder encoder(descriptor.type);
        encoder.putU32(descriptor.version);
        encoder.putU32(static_cast<std::uint32_t>(descriptor.replication_factor));
        encoder.putU32(static_cast<std::uint32_t>(descriptor.peers.size()));
        for (const auto &peer : descriptor.peers)
        {
            encoder.putString(peer.id);
            encoder.putU64(peer.total_blocks);
        }
        return encoder.release();
    }

    Result<RingDescriptor> decodeRingDescriptor(RingDecoder &decoder, RingType type)
    {
        RingDescriptor descriptor;
        descriptor.type = type;

        std::uint32_t replication = 0;
        std::uint32_t count = 0;
        if (decoder.getU32(descriptor.version) != Status::OK ||
            decoder.getU32(replication) != Status::OK ||
            decoder.getU32(count) != Status::OK)
        {
            return {Status::INVALID_REQUEST, "truncated ring descriptor"};
        }
        descriptor.replication_factor = replication;

        for (std::uint32_t i = 0; i < count; ++i)
        {
            PeerInfo peer;
            if (decoder.getString(peer.id) != Status::OK || decoder.getU64(peer.total_blocks) != Status::OK)
            {
                return {Status::INVALID_REQUEST, "truncated peer list"};
            }
            descriptor.peers.push_back(std::move(peer));
        }
        return descriptor;
    }
} // namespace blockring
