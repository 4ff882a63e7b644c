#ifndef __TYPES_HPP__
#define __TYPES_HPP__

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace blockring
{
    using PeerId = std::string;
    using VolumeId = std::uint64_t;
    using INodeId = std::uint64_t;
    using IndexId = std::uint64_t;
    using Bytes = std::vector<std::uint8_t>;

    enum class Status
    {
        OK,
        NOT_FOUND,
        INTERNAL_ERROR,
        INVALID_REQUEST,
        INVALID_ARGUMENT,

        UNKNOWN_RING_KIND,
        RING_CONSTRUCTION_ERROR,
        PLACEMENT_QUERY_ERROR,
        CAPACITY_WEIGHT_UNDEFINED
    };

    [[nodiscard]] inline const char *statusToString(Status status) noexcept
    {
        switch (status)
        {
        case Status::OK:
            return "OK";
        case Status::NOT_FOUND:
            return "NOT_FOUND";
        case Status::INTERNAL_ERROR:
            return "INTERNAL_ERROR";
        case Status::INVALID_REQUEST:
            return "INVALID_REQUEST";
        case Status::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case Status::UNKNOWN_RING_KIND:
            return "UNKNOWN_RING_KIND";
        case Status::RING_CONSTRUCTION_ERROR:
            return "RING_CONSTRUCTION_ERROR";
        case Status::PLACEMENT_QUERY_ERROR:
            return "PLACEMENT_QUERY_ERROR";
        case Status::CAPACITY_WEIGHT_UNDEFINED:
            return "CAPACITY_WEIGHT_UNDEFINED";
        default:
            return "UNKNOWN";
        }
    }

    template <typename T>
    class Result
    {
    public:
        Result(T value) : _value(std::move(value)), _status(Status::OK)
        {
        }
        Result(Status status, std::string message = {}) : _status(status), _message(std::move(message))
        {
        }

        bool ok() const { return _status == Status::OK; }
        Status status() const { return _status; }

        // Diagnostic text for a failed result; empty on success.
        const std::string &message() const { return _message; }

        const T &value() const
        {
            if (!ok())
            {
                throw std::runtime_error("Accessing value of failed result");
            }
            return _value.value();
        }

        T &value()
        {
            if (!ok())
            {
                throw std::runtime_error("Accessing value of failed result");
            }
            return _value.value();
        }

        std::string describeError() const
        {
            std::string text = statusToString(_status);
            if (!_message.empty())
            {
                text += ": " + _message;
            }
            return text;
        }

    private:
        std::optional<T> _value;
        Status _status;
        std::string _message;
    };
} // namespace blockring

#endif // __TYPES_HPP__
