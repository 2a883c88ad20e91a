#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace loadopts::util
{
    std::vector<std::string_view> split(std::string_view text, char sep);

    std::string_view trim(std::string_view text) noexcept;

    std::string to_lower(std::string_view text);

    /// Whole-string base-10 int64; false on any trailing junk or overflow.
    bool parse_int64(std::string_view text, std::int64_t& out) noexcept;

} // namespace loadopts::util
