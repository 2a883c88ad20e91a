#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace loadopts
{
    /// Canonical text of an IPv4 or IPv6 literal. Throws ParseError.
    std::string parse_ip(std::string_view text);

    /// IP network in CIDR form ("10.0.0.0/8", "fd00::/8").
    struct IPNet
    {
        std::string address; // canonical, masked to the prefix
        int prefix_length = 0;
        bool v6 = false;

        std::string to_string() const;

        bool contains(std::string_view ip) const;

        bool operator==(const IPNet&) const = default;
    };

    /// Throws ParseError for malformed CIDR text.
    IPNet parse_cidr(std::string_view text);

} // namespace loadopts
