#include "loadopts/errors.hpp"
#include "loadopts/json.hpp"
#include "loadopts/tls.hpp"

#include "config/json_detail.hpp"

namespace loadopts::json
{
    using namespace detail;

    namespace
    {
        TLSVersion version_from_name(const std::string& name, std::string_view path)
        {
            if (name.empty())
                return TLSVersion::None;

            auto version = tls_version_from_name(name);
            if (!version)
                value_error(path, "unsupported TLS version: " + name);
            return *version;
        }

    } // namespace

    /* ========================================================================
     * TLSVersions
     * ====================================================================== */

    // Always the object shape; the zero range has "" at both ends.
    Value to_value(const TLSVersions& versions)
    {
        Value value;
        auto& fields = *value.mutable_struct_value()->mutable_fields();
        fields["min"] = make_string(std::string(tls_version_name(versions.min)));
        fields["max"] = make_string(std::string(tls_version_name(versions.max)));
        return value;
    }

    TLSVersions tls_versions_from_value(const Value& value, std::string_view path)
    {
        TLSVersions versions;
        switch (value.kind_case())
        {
        case Value::kStringValue:
        {
            // "tls1.2" pins both ends; "" leaves the range unconstrained
            const auto version = version_from_name(value.string_value(), path);
            versions.min = version;
            versions.max = version;
            break;
        }
        case Value::kStructValue:
        {
            const auto& object = value.struct_value();
            if (const Value* min = find(object, "min"))
            {
                const auto min_path = member_path(path, "min");
                versions.min = version_from_name(as_string(*min, min_path), min_path);
            }
            if (const Value* max = find(object, "max"))
            {
                const auto max_path = member_path(path, "max");
                versions.max = version_from_name(as_string(*max, max_path), max_path);
            }
            break;
        }
        default:
            type_error(path, "string or object", value);
        }
        return versions;
    }

    /* ========================================================================
     * TLSCipherSuites
     * ====================================================================== */

    Value to_value(const TLSCipherSuites& suites)
    {
        Value value;
        auto* list = value.mutable_list_value();
        for (auto id : suites)
        {
            auto name = cipher_suite_name(id);
            if (!name)
                throw Error("cannot encode unsupported cipher suite id: " + std::to_string(id));
            *list->add_values() = make_string(std::string(*name));
        }
        return value;
    }

    TLSCipherSuites tls_cipher_suites_from_value(const Value& value, std::string_view path)
    {
        const auto& list = as_list(value, path);

        TLSCipherSuites suites;
        suites.reserve(static_cast<std::size_t>(list.values_size()));
        for (int i = 0; i < list.values_size(); ++i)
        {
            const auto item_path = index_path(path, i);
            const auto& name = as_string(list.values(i), item_path);
            auto id = cipher_suite_id(name);
            if (!id)
                value_error(item_path, "unsupported cipher suite: " + name);
            suites.push_back(*id);
        }
        return suites;
    }

    /* ========================================================================
     * TLSAuth
     * ====================================================================== */

    Value to_value(const TLSAuth& auth)
    {
        const auto& fields = auth.fields();

        Value value;
        auto& object = *value.mutable_struct_value()->mutable_fields();

        Value domains;
        auto* list = domains.mutable_list_value();
        for (const auto& domain : fields.domains)
            *list->add_values() = make_string(domain);

        object["domains"] = std::move(domains);
        object["cert"] = make_string(fields.cert);
        object["key"] = make_string(fields.key);
        return value;
    }

    TLSAuthPtr tls_auth_from_value(const Value& value, std::string_view path)
    {
        const auto& object = as_object(value, path);

        TLSAuthFields fields;
        if (const Value* domains = find(object, "domains"))
        {
            const auto domains_path = member_path(path, "domains");
            const auto& list = as_list(*domains, domains_path);
            for (int i = 0; i < list.values_size(); ++i)
                fields.domains.push_back(as_string(list.values(i), index_path(domains_path, i)));
        }
        if (const Value* cert = find(object, "cert"))
            fields.cert = as_string(*cert, member_path(path, "cert"));
        if (const Value* key = find(object, "key"))
            fields.key = as_string(*key, member_path(path, "key"));

        return make_tls_auth(std::move(fields));
    }

} // namespace loadopts::json
