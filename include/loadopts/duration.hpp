#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace loadopts
{
    using Duration = std::chrono::nanoseconds;

    /// Compound unit text, e.g. "2m0s", "1h0m0s", "1.5s", "250ms", "0s".
    std::string format_duration(Duration d);

    /**
     * @brief Parse compound unit text.
     *
     * Accepts an optional sign followed by one or more `<number><unit>` groups,
     * where number may carry a fraction and unit is one of ns, us, µs, μs, ms,
     * s, m, h. A bare "0" is accepted. Throws ParseError otherwise.
     */
    Duration parse_duration(std::string_view text);

} // namespace loadopts
