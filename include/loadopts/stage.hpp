#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "loadopts/nullable.hpp"

namespace loadopts
{
    /// One ramp segment: run for `duration`, moving the VU count toward `target`.
    /// An absent target holds the current level.
    struct Stage
    {
        NullDuration duration;
        NullInt target;

        bool operator==(const Stage&) const = default;
    };

    /**
     * @brief Parse the compact stage list grammar.
     *
     * "<duration>[:<target>]" segments separated by commas, e.g. "1s,2s:100".
     * Empty text yields an empty list. Throws ParseError naming the segment.
     */
    std::vector<Stage> parse_stages(std::string_view text);

    /// Inverse of parse_stages; stages without a duration render as "0s".
    std::string format_stages(const std::vector<Stage>& stages);

} // namespace loadopts
