#include "units.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <exception>
#include <limits>
#include <unordered_map>

namespace blockring
{
    namespace
    {
        const std::unordered_map<std::string, std::uint64_t> &unitMultipliers()
        {
            static const std::unordered_map<std::string, std::uint64_t> units = {
                {"", 1ULL},
                {"b", 1ULL},
                {"k", 1000ULL},
                {"kb", 1000ULL},
                {"m", 1000ULL * 1000},
                {"mb", 1000ULL * 1000},
                {"g", 1000ULL * 1000 * 1000},
                {"gb", 1000ULL * 1000 * 1000},
                {"t", 1000ULL * 1000 * 1000 * 1000},
                {"tb", 1000ULL * 1000 * 1000 * 1000},
                {"p", 1000ULL * 1000 * 1000 * 1000 * 1000},
                {"pb", 1000ULL * 1000 * 1000 * 1000 * 1000},
                {"ki", 1ULL << 10},
                {"kib", 1ULL << 10},
                {"mi", 1ULL << 20},
                {"mib", 1ULL << 20},
                {"gi", 1ULL << 30},
                {"gib", 1ULL << 30},
                {"ti", 1ULL << 40},
                {"tib", 1ULL << 40},
                {"pi", 1ULL << 50},
                {"pib", 1ULL << 50},
            };
            return units;
        }

        std::string trim(const std::string &s)
        {
            const auto first = s.find_first_not_of(" \t");
            if (first == std::string::npos)
                return {};
            const auto last = s.find_last_not_of(" \t");
            return s.substr(first, last - first + 1);
        }
    } // namespace

    Result<std::uint64_t> parseBytes(const std::string &text)
    {
        const auto input = trim(text);
        std::size_t pos = 0;
        bool seen_digit = false;
        bool seen_point = false;
        while (pos < input.size())
        {
            const auto c = input[pos];
            if (std::isdigit(static_cast<unsigned char>(c)))
            {
                seen_digit = true;
            }
            else if (c == '.' && !seen_point)
            {
                seen_point = true;
            }
            else
            {
                break;
            }
            ++pos;
        }
        if (!seen_digit)
        {
            return {Status::INVALID_ARGUMENT, "no number in size '" + text + "'"};
        }

        std::string unit = trim(input.substr(pos));
        std::transform(unit.begin(), unit.end(), unit.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        const auto it = unitMultipliers().find(unit);
        if (it == unitMultipliers().end())
        {
            return {Status::INVALID_ARGUMENT, "unknown size unit '" + unit + "' in '" + text + "'"};
        }

        const auto number = input.substr(0, pos);
        try
        {
            if (!seen_point)
            {
                const auto value = std::stoull(number);
                if (value > std::numeric_limits<std::uint64_t>::max() / it->second)
                {
                    return {Status::INVALID_ARGUMENT, "size '" + text + "' overflows"};
                }
                return value * it->second;
            }

            const long double scaled = std::stold(number) * static_cast<long double>(it->second);
            if (scaled >= static_cast<long double>(std::numeric_limits<std::uint64_t>::max()))
            {
                return {Status::INVALID_ARGUMENT, "size '" + text + "' overflows"};
            }
            return static_cast<std::uint64_t>(scaled);
        }
        catch (const std::exception &e)
        {
            return {Status::INVALID_ARGUMENT, "cannot parse size '" + text + "': " + e.what()};
        }
    }

    std::string formatIBytes(std::uint64_t bytes)
    {
        static const char *const suffixes[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"};
        if (bytes < 1024)
        {
            return std::to_string(bytes) + " B";
        }

        int exponent = 0;
        double value = static_cast<double>(bytes);
        while (value >= 1024.0 && exponent < 6)
        {
            value /= 1024.0;
            ++exponent;
        }
        value = std::floor(value * 10.0 + 0.5) / 10.0;

        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), value < 10 ? "%.1f %s" : "%.0f %s", value, suffixes[exponent]);
        return buffer;
    }
} // namespace blockring
