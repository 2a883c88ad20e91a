#pragma once

#include <string>
#include <vector>

namespace loadopts
{
    /// A single threshold expression, e.g. "p(95)<500". Not interpreted here.
    struct Threshold
    {
        std::string source;

        bool operator==(const Threshold&) const = default;
    };

    struct Thresholds
    {
        std::vector<Threshold> thresholds;

        bool operator==(const Thresholds&) const = default;
    };

} // namespace loadopts
