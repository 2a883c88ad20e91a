#include "json_detail.hpp"

#include <cmath>

#include "loadopts/errors.hpp"
#include "util/text.hpp"

namespace loadopts::json::detail
{
    std::string_view kind_name(const Value& value) noexcept
    {
        switch (value.kind_case())
        {
        case Value::kNullValue:
            return "null";
        case Value::kNumberValue:
            return "number";
        case Value::kStringValue:
            return "string";
        case Value::kBoolValue:
            return "bool";
        case Value::kStructValue:
            return "object";
        case Value::kListValue:
            return "array";
        case Value::KIND_NOT_SET:
            break;
        }
        return "nothing";
    }

    void type_error(std::string_view path, std::string_view expected, const Value& got)
    {
        throw DecodeError(std::string(path) + ": expected " + std::string(expected) +
                          ", got " + std::string(kind_name(got)));
    }

    void value_error(std::string_view path, const std::string& reason)
    {
        throw DecodeError(std::string(path) + ": " + reason);
    }

    std::string member_path(std::string_view path, std::string_view key)
    {
        if (path.empty())
            return std::string(key);
        std::string out(path);
        out.append(".").append(key);
        return out;
    }

    std::string index_path(std::string_view path, int index)
    {
        return std::string(path) + "[" + std::to_string(index) + "]";
    }

    const std::string& as_string(const Value& value, std::string_view path)
    {
        if (value.kind_case() != Value::kStringValue)
            type_error(path, "string", value);
        return value.string_value();
    }

    bool as_bool(const Value& value, std::string_view path)
    {
        if (value.kind_case() != Value::kBoolValue)
            type_error(path, "bool", value);
        return value.bool_value();
    }

    std::int64_t as_int(const Value& value, std::string_view path)
    {
        if (value.kind_case() == Value::kStringValue)
        {
            std::int64_t number = 0;
            if (!util::parse_int64(value.string_value(), number))
                value_error(path, "expected integer, got \"" + value.string_value() + "\"");
            return number;
        }
        if (value.kind_case() != Value::kNumberValue)
            type_error(path, "integer", value);

        // beyond 2^53 the double may already be a rounded neighbour
        const double number = value.number_value();
        if (!std::isfinite(number) || std::trunc(number) != number)
            value_error(path, "expected integer, got " + std::to_string(number));
        if (std::fabs(number) > static_cast<double>(kMaxExactInt))
            value_error(path, "integer " + std::to_string(number) + " is not exact as a JSON number, quote it");
        return static_cast<std::int64_t>(number);
    }

    const Struct& as_object(const Value& value, std::string_view path)
    {
        if (value.kind_case() != Value::kStructValue)
            type_error(path, "object", value);
        return value.struct_value();
    }

    const ListValue& as_list(const Value& value, std::string_view path)
    {
        if (value.kind_case() != Value::kListValue)
            type_error(path, "array", value);
        return value.list_value();
    }

    const Value* find(const Struct& object, std::string_view key)
    {
        const auto& fields = object.fields();
        auto it = fields.find(std::string(key));
        if (it == fields.end())
            return nullptr;
        return &it->second;
    }

    Value make_string(std::string text)
    {
        Value value;
        value.set_string_value(std::move(text));
        return value;
    }

    Value make_bool(bool flag)
    {
        Value value;
        value.set_bool_value(flag);
        return value;
    }

    Value make_int(std::int64_t number)
    {
        Value value;
        if (number >= -kMaxExactInt && number <= kMaxExactInt)
            value.set_number_value(static_cast<double>(number));
        else
            value.set_string_value(std::to_string(number));
        return value;
    }

} // namespace loadopts::json::detail
