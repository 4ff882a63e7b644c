#include "ring.hpp"
#include <algorithm>
#include <cctype>

namespace blockring
{
    std::string ringTypeToString(RingType type)
    {
        switch (type)
        {
        case RingType::EMPTY:
            return "empty";
        case RingType::SINGLE:
            return "single";
        case RingType::MOD:
            return "mod";
        case RingType::UNION:
            return "union";
        case RingType::KETAMA:
            return "ketama";
        default:
            return "unknown";
        }
    }

    Result<RingType> ringTypeFromString(const std::string &name)
    {
        std::string lower(name);
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (lower == "empty")
            return RingType::EMPTY;
        if (lower == "single")
            return RingType::SINGLE;
        if (lower == "mod")
            return RingType::MOD;
        if (lower == "union")
            return RingType::UNION;
        if (lower == "ketama")
            return RingType::KETAMA;
        return {Status::UNKNOWN_RING_KIND, "unknown ring type: " + name};
    }
} // namespace blockring
