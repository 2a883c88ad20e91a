#include "loadopts/duration.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

#include "loadopts/errors.hpp"

namespace loadopts
{
    namespace
    {
        constexpr std::uint64_t kNanosecond = 1;
        constexpr std::uint64_t kMicrosecond = 1000 * kNanosecond;
        constexpr std::uint64_t kMillisecond = 1000 * kMicrosecond;
        constexpr std::uint64_t kSecond = 1000 * kMillisecond;
        constexpr std::uint64_t kMinute = 60 * kSecond;
        constexpr std::uint64_t kHour = 60 * kMinute;

        constexpr std::uint64_t kMaxMagnitude = std::uint64_t{1} << 63;

        // micro sign (U+00B5) is what gets printed; greek mu (U+03BC) is accepted too
        constexpr std::string_view kMicroSign = "\xC2\xB5";

        constexpr std::array<std::pair<std::string_view, std::uint64_t>, 8> kUnits = {{
            {"ns", kNanosecond},
            {"us", kMicrosecond},
            {"\xC2\xB5s", kMicrosecond},
            {"\xCE\xBCs", kMicrosecond},
            {"ms", kMillisecond},
            {"s", kSecond},
            {"m", kMinute},
            {"h", kHour},
        }};

        // Digits of v % 10^prec with trailing zeros dropped, prefixed by '.'
        // when anything remains. v is left holding v / 10^prec.
        std::string format_fraction(std::uint64_t& v, int prec)
        {
            std::string digits;
            bool print = false;
            for (int i = 0; i < prec; ++i)
            {
                const auto digit = static_cast<char>(v % 10);
                print = print || digit != 0;
                if (print)
                    digits.insert(digits.begin(), static_cast<char>('0' + digit));
                v /= 10;
            }
            if (print)
                digits.insert(digits.begin(), '.');
            return digits;
        }

        [[noreturn]] void invalid(std::string_view text, std::string_view reason)
        {
            throw ParseError("invalid duration \"" + std::string(text) + "\": " + std::string(reason));
        }

        bool is_digit(char c) noexcept
        {
            return c >= '0' && c <= '9';
        }

    } // namespace

    std::string format_duration(Duration d)
    {
        const auto count = d.count();
        const bool neg = count < 0;
        std::uint64_t u = static_cast<std::uint64_t>(count);
        if (neg)
            u = ~u + 1;

        std::string out;
        if (u < kSecond)
        {
            if (u == 0)
                return "0s";

            int prec = 0;
            std::string unit;
            if (u < kMicrosecond)
            {
                unit = "ns";
            }
            else if (u < kMillisecond)
            {
                prec = 3;
                unit = std::string(kMicroSign) + "s";
            }
            else
            {
                prec = 6;
                unit = "ms";
            }
            std::string frac = format_fraction(u, prec);
            out = std::to_string(u) + frac + unit;
        }
        else
        {
            std::string frac = format_fraction(u, 9);
            out = std::to_string(u % 60) + frac + "s";
            u /= 60;
            if (u > 0)
            {
                out = std::to_string(u % 60) + "m" + out;
                u /= 60;
                if (u > 0)
                    out = std::to_string(u) + "h" + out;
            }
        }

        if (neg)
            out.insert(out.begin(), '-');
        return out;
    }

    Duration parse_duration(std::string_view text)
    {
        std::string_view s = text;
        bool neg = false;
        if (!s.empty() && (s.front() == '-' || s.front() == '+'))
        {
            neg = s.front() == '-';
            s.remove_prefix(1);
        }
        if (s == "0")
            return Duration::zero();
        if (s.empty())
            invalid(text, "empty");

        std::uint64_t total = 0;
        while (!s.empty())
        {
            if (!(s.front() == '.' || is_digit(s.front())))
                invalid(text, "expected a number");

            // integer part
            std::uint64_t v = 0;
            std::size_t pos = 0;
            while (pos < s.size() && is_digit(s[pos]))
            {
                if (v > (kMaxMagnitude - 1) / 10)
                    invalid(text, "overflow");
                v = v * 10 + static_cast<std::uint64_t>(s[pos] - '0');
                if (v > kMaxMagnitude)
                    invalid(text, "overflow");
                ++pos;
            }
            const bool pre = pos > 0;
            s.remove_prefix(pos);

            // fraction part
            std::uint64_t f = 0;
            double scale = 1.0;
            bool post = false;
            if (!s.empty() && s.front() == '.')
            {
                s.remove_prefix(1);
                pos = 0;
                bool overflow = false;
                while (pos < s.size() && is_digit(s[pos]))
                {
                    if (!overflow)
                    {
                        if (f > (std::numeric_limits<std::int64_t>::max() - 9) / 10)
                        {
                            overflow = true;
                        }
                        else
                        {
                            f = f * 10 + static_cast<std::uint64_t>(s[pos] - '0');
                            scale *= 10;
                        }
                    }
                    ++pos;
                }
                post = pos > 0;
                s.remove_prefix(pos);
            }
            if (!pre && !post)
                invalid(text, "expected a number");

            // unit
            pos = 0;
            while (pos < s.size() && s[pos] != '.' && !is_digit(s[pos]))
                ++pos;
            if (pos == 0)
                invalid(text, "missing unit");
            const std::string_view unit_text = s.substr(0, pos);
            s.remove_prefix(pos);

            std::uint64_t unit = 0;
            for (const auto& [name, factor] : kUnits)
            {
                if (name == unit_text)
                {
                    unit = factor;
                    break;
                }
            }
            if (unit == 0)
                invalid(text, "unknown unit \"" + std::string(unit_text) + "\"");

            if (v > kMaxMagnitude / unit)
                invalid(text, "overflow");
            v *= unit;
            if (f > 0)
            {
                v += static_cast<std::uint64_t>(static_cast<double>(f) * (static_cast<double>(unit) / scale));
                if (v > kMaxMagnitude)
                    invalid(text, "overflow");
            }
            total += v;
            if (total > kMaxMagnitude)
                invalid(text, "overflow");
        }

        if (neg)
        {
            if (total == kMaxMagnitude)
                return Duration(std::numeric_limits<std::int64_t>::min());
            return Duration(-static_cast<std::int64_t>(total));
        }
        if (total > kMaxMagnitude - 1)
            invalid(text, "overflow");
        return Duration(static_cast<std::int64_t>(total));
    }

} // namespace loadopts
