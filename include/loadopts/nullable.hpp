#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "loadopts/duration.hpp"

namespace loadopts
{
    /**
     * @brief Value paired with an explicit presence flag.
     *
     * - valid == false : not provided, value must not be read
     * - valid == true  : provided, value may be the type's zero
     */
    template <typename T>
    struct Nullable
    {
        T value{};
        bool valid = false;

        Nullable() = default;
        Nullable(T v, bool is_valid) : value(std::move(v)), valid(is_valid) {}

        Nullable& operator=(T v)
        {
            value = std::move(v);
            valid = true;
            return *this;
        }

        void reset() noexcept
        {
            value = T{};
            valid = false;
        }

        explicit operator bool() const noexcept { return valid; }

        // Value when present, fallback otherwise.
        T value_or(T fallback) const
        {
            return valid ? value : std::move(fallback);
        }

        bool operator==(const Nullable&) const = default;
    };

    template <typename T>
    Nullable<T> null_from(T v)
    {
        return Nullable<T>(std::move(v), true);
    }

    using NullBool = Nullable<bool>;
    using NullInt = Nullable<std::int64_t>;
    using NullString = Nullable<std::string>;
    using NullDuration = Nullable<Duration>;

    inline NullBool null_bool(bool v) { return null_from(v); }
    inline NullInt null_int(std::int64_t v) { return null_from(v); }
    inline NullString null_string(std::string v) { return null_from(std::move(v)); }
    inline NullDuration null_duration(Duration v) { return null_from(v); }

} // namespace loadopts
