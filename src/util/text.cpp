#include "text.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <system_error>

namespace loadopts::util
{
    std::vector<std::string_view> split(std::string_view text, char sep)
    {
        std::vector<std::string_view> parts;
        std::size_t start = 0;
        while (true)
        {
            const auto pos = text.find(sep, start);
            if (pos == std::string_view::npos)
            {
                parts.push_back(text.substr(start));
                break;
            }
            parts.push_back(text.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }

    std::string_view trim(std::string_view text) noexcept
    {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            text.remove_prefix(1);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            text.remove_suffix(1);
        return text;
    }

    std::string to_lower(std::string_view text)
    {
        std::string out(text);
        for (auto& c : out)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    bool parse_int64(std::string_view text, std::int64_t& out) noexcept
    {
        if (text.empty())
            return false;

        // from_chars rejects a leading '+'
        if (text.front() == '+')
        {
            text.remove_prefix(1);
            if (text.empty() || text.front() == '-')
                return false;
        }

        std::int64_t value = 0;
        const auto* first = text.data();
        const auto* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, value, 10);
        if (ec != std::errc() || ptr != last)
            return false;

        out = value;
        return true;
    }

} // namespace loadopts::util
