#include "loadopts/net.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <array>
#include <cstring>

#include "loadopts/errors.hpp"
#include "util/text.hpp"

namespace loadopts
{
    namespace
    {
        struct RawAddress
        {
            std::array<unsigned char, 16> bytes{};
            bool v6 = false;

            std::size_t size() const noexcept { return v6 ? 16 : 4; }
        };

        bool to_raw(std::string_view text, RawAddress& out)
        {
            const std::string copy(text);
            if (inet_pton(AF_INET, copy.c_str(), out.bytes.data()) == 1)
            {
                out.v6 = false;
                return true;
            }
            if (inet_pton(AF_INET6, copy.c_str(), out.bytes.data()) == 1)
            {
                out.v6 = true;
                return true;
            }
            return false;
        }

        std::string to_text(const RawAddress& raw)
        {
            char buf[INET6_ADDRSTRLEN] = {};
            const int family = raw.v6 ? AF_INET6 : AF_INET;
            if (!inet_ntop(family, raw.bytes.data(), buf, sizeof(buf)))
                throw ParseError("cannot format IP address");
            return buf;
        }

        void apply_mask(RawAddress& raw, int prefix_length)
        {
            for (std::size_t i = 0; i < raw.size(); ++i)
            {
                const int bits = prefix_length - static_cast<int>(i * 8);
                if (bits >= 8)
                    continue;
                if (bits <= 0)
                    raw.bytes[i] = 0;
                else
                    raw.bytes[i] &= static_cast<unsigned char>(0xFF << (8 - bits));
            }
        }

    } // namespace

    std::string parse_ip(std::string_view text)
    {
        RawAddress raw;
        if (!to_raw(util::trim(text), raw))
            throw ParseError("invalid IP address \"" + std::string(text) + "\"");
        return to_text(raw);
    }

    IPNet parse_cidr(std::string_view text)
    {
        const auto slash = text.find('/');
        if (slash == std::string_view::npos)
            throw ParseError("invalid CIDR address \"" + std::string(text) + "\": missing prefix length");

        RawAddress raw;
        if (!to_raw(text.substr(0, slash), raw))
            throw ParseError("invalid CIDR address \"" + std::string(text) + "\"");

        std::int64_t prefix = 0;
        const int max_prefix = raw.v6 ? 128 : 32;
        if (!util::parse_int64(text.substr(slash + 1), prefix) || prefix < 0 || prefix > max_prefix)
            throw ParseError("invalid CIDR address \"" + std::string(text) + "\": bad prefix length");

        apply_mask(raw, static_cast<int>(prefix));

        IPNet net;
        net.address = to_text(raw);
        net.prefix_length = static_cast<int>(prefix);
        net.v6 = raw.v6;
        return net;
    }

    std::string IPNet::to_string() const
    {
        return address + "/" + std::to_string(prefix_length);
    }

    bool IPNet::contains(std::string_view ip) const
    {
        RawAddress candidate;
        if (!to_raw(ip, candidate) || candidate.v6 != v6)
            return false;

        RawAddress network;
        if (!to_raw(address, network))
            return false;

        apply_mask(candidate, prefix_length);
        return std::memcmp(candidate.bytes.data(), network.bytes.data(), candidate.size()) == 0;
    }

} // namespace loadopts
