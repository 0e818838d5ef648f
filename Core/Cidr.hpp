#pragma once

// Cidr.hpp — IPv4 CIDR helpers, including the BSD netstat display shorthand.

#include <cstdint>
#include <optional>
#include <string>

namespace Cidr
{
    struct Block
    {
        std::string   address;     // as written, e.g. "91.108.4.0"
        std::uint8_t  prefix = 32;
        std::uint32_t value  = 0;  // host order

        std::string ToString() const;
    };

    // "a.b.c.d/n" with n in 0..32. No prefix means not a CIDR.
    std::optional<Block> Parse(const std::string &text);

    /**
     * @brief Renders a network the way `netstat -rn` prints it.
     *
     *  /16 ending in .0.0          -> "172.217"
     *  x.0.0.0, x.y.0.0 (not /16)  -> "10/8", "100.64/10"
     *  x.y.z.0                     -> "185.76.151/24"
     *  otherwise                   -> "1.2.3.4/32"
     */
    std::string NetstatForm(const Block &block);

    // Convenience for callers holding a string; returns the input unchanged if it is not a CIDR.
    std::string NetstatForm(const std::string &cidr);

    /**
     * @brief Reads a netstat destination back into a block.
     *
     * Missing octets are zero; without "/n" the prefix is implied by the number of
     * octets shown (1 -> /8, 2 -> /16, 3 -> /24, 4 -> /32). "default" is 0.0.0.0/0.
     */
    std::optional<Block> ParseDisplay(const std::string &text);

    bool IsIPv4(const std::string &text);

    // RFC 1918
    bool IsPrivate(const std::string &ip);

    bool Contains(const Block &net, const std::string &ip);

    // true if every address of `inner` is inside `outer`
    bool Covers(const Block &outer, const Block &inner);
}
