#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

namespace loadopts::json::detail
{
    using google::protobuf::ListValue;
    using google::protobuf::Struct;
    using google::protobuf::Value;

    // Largest magnitude a JSON number carries without rounding (2^53 - 1).
    // Integers outside it travel as decimal strings, as proto3 JSON does for int64.
    inline constexpr std::int64_t kMaxExactInt = (std::int64_t{1} << 53) - 1;

    std::string_view kind_name(const Value& value) noexcept;

    [[noreturn]] void type_error(std::string_view path, std::string_view expected, const Value& got);

    [[noreturn]] void value_error(std::string_view path, const std::string& reason);

    std::string member_path(std::string_view path, std::string_view key);
    std::string index_path(std::string_view path, int index);

    const std::string& as_string(const Value& value, std::string_view path);
    bool as_bool(const Value& value, std::string_view path);
    /// Number within kMaxExactInt, or a decimal string for any int64.
    std::int64_t as_int(const Value& value, std::string_view path);
    const Struct& as_object(const Value& value, std::string_view path);
    const ListValue& as_list(const Value& value, std::string_view path);

    /// Field of `object`, or nullptr when missing.
    const Value* find(const Struct& object, std::string_view key);

    Value make_string(std::string text);
    Value make_bool(bool flag);
    /// Number when exact, decimal string otherwise.
    Value make_int(std::int64_t number);

} // namespace loadopts::json::detail
