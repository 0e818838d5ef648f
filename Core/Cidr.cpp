#include "Core/Cidr.hpp"

#include <sstream>
#include <vector>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/system/error_code.hpp>

namespace
{
    std::uint32_t MaskOf(std::uint8_t prefix)
    {
        return prefix == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix));
    }

    std::optional<std::uint32_t> ToV4(const std::string &s)
    {
        boost::system::error_code ec;
        auto a = boost::asio::ip::make_address_v4(s, ec);
        if (ec) return std::nullopt;
        return a.to_uint();
    }

    std::optional<std::uint8_t> ParsePrefix(const std::string &s)
    {
        if (s.empty() || s.size() > 2) return std::nullopt;
        int v = 0;
        for (char c : s)
        {
            if (c < '0' || c > '9') return std::nullopt;
            v = v * 10 + (c - '0');
        }
        if (v > 32) return std::nullopt;
        return static_cast<std::uint8_t>(v);
    }

    std::vector<std::string> Split(const std::string &s, char sep)
    {
        std::vector<std::string> out;
        std::string cur;
        for (char c : s)
        {
            if (c == sep)
            {
                out.push_back(cur);
                cur.clear();
            }
            else
            {
                cur.push_back(c);
            }
        }
        out.push_back(cur);
        return out;
    }
}

namespace Cidr
{
    std::string Block::ToString() const
    {
        return address + "/" + std::to_string(prefix);
    }

    std::optional<Block> Parse(const std::string &text)
    {
        const auto slash = text.find('/');
        if (slash == std::string::npos) return std::nullopt;

        const std::string addr = text.substr(0, slash);
        auto v   = ToV4(addr);
        auto pfx = ParsePrefix(text.substr(slash + 1));
        if (!v || !pfx) return std::nullopt;

        Block b;
        b.address = addr;
        b.prefix  = *pfx;
        b.value   = *v;
        return b;
    }

    std::string NetstatForm(const Block &block)
    {
        // the kernel stores the network address, host bits cleared
        const std::uint32_t v = block.value & MaskOf(block.prefix);
        const unsigned o1 = (v >> 24) & 0xFF;
        const unsigned o2 = (v >> 16) & 0xFF;
        const unsigned o3 = (v >> 8) & 0xFF;
        const unsigned o4 = v & 0xFF;
        const std::string p = "/" + std::to_string(block.prefix);

        std::ostringstream os;
        if (o3 == 0 && o4 == 0 && block.prefix == 16)
        {
            os << o1 << "." << o2;
        }
        else if (o2 == 0 && o3 == 0 && o4 == 0)
        {
            os << o1 << p;
        }
        else if (o3 == 0 && o4 == 0)
        {
            os << o1 << "." << o2 << p;
        }
        else if (o4 == 0)
        {
            os << o1 << "." << o2 << "." << o3 << p;
        }
        else
        {
            os << o1 << "." << o2 << "." << o3 << "." << o4 << p;
        }
        return os.str();
    }

    std::string NetstatForm(const std::string &cidr)
    {
        auto b = Parse(cidr);
        return b ? NetstatForm(*b) : cidr;
    }

    std::optional<Block> ParseDisplay(const std::string &text)
    {
        if (text == "default")
        {
            Block b;
            b.address = "0.0.0.0";
            b.prefix  = 0;
            return b;
        }

        std::string head = text;
        std::optional<std::uint8_t> pfx;
        const auto slash = text.find('/');
        if (slash != std::string::npos)
        {
            head = text.substr(0, slash);
            pfx  = ParsePrefix(text.substr(slash + 1));
            if (!pfx) return std::nullopt;
        }

        auto octets = Split(head, '.');
        if (octets.empty() || octets.size() > 4) return std::nullopt;
        for (const auto &o : octets)
        {
            if (o.empty()) return std::nullopt;
        }

        const std::size_t shown = octets.size();
        while (octets.size() < 4) octets.emplace_back("0");

        const std::string addr = octets[0] + "." + octets[1] + "." + octets[2] + "." + octets[3];
        auto v = ToV4(addr);
        if (!v) return std::nullopt;

        Block b;
        b.address = addr;
        b.value   = *v;
        b.prefix  = pfx ? *pfx : static_cast<std::uint8_t>(shown * 8);
        return b;
    }

    bool IsIPv4(const std::string &text)
    {
        return ToV4(text).has_value();
    }

    bool IsPrivate(const std::string &ip)
    {
        auto v = ToV4(ip);
        if (!v) return false;
        const std::uint32_t a = *v;
        return (a & 0xFF000000u) == 0x0A000000u      // 10/8
               || (a & 0xFFF00000u) == 0xAC100000u   // 172.16/12
               || (a & 0xFFFF0000u) == 0xC0A80000u;  // 192.168/16
    }

    bool Contains(const Block &net, const std::string &ip)
    {
        auto v = ToV4(ip);
        if (!v) return false;
        const std::uint32_t m = MaskOf(net.prefix);
        return (*v & m) == (net.value & m);
    }

    bool Covers(const Block &outer, const Block &inner)
    {
        if (inner.prefix < outer.prefix) return false;
        const std::uint32_t m = MaskOf(outer.prefix);
        return (inner.value & m) == (outer.value & m);
    }
}
