#ifndef __UNITS_HPP__
#define __UNITS_HPP__

#include "types.hpp"
#include <cstdint>
#include <string>

namespace blockring
{
    // Parses sizes such as "4096", "256KiB", "1.5 GB" or "1t". SI suffixes are
    // powers of 1000, IEC suffixes (KiB, MiB, ...) powers of 1024.
    [[nodiscard]] Result<std::uint64_t> parseBytes(const std::string &text);

    // IEC rendering: "512 B", "1.5 KiB", "256 KiB", "1.0 TiB".
    [[nodiscard]] std::string formatIBytes(std::uint64_t bytes);
} // namespace blockring

#endif // __UNITS_HPP__
