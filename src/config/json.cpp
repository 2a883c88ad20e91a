#include "loadopts/json.hpp"

#include <google/protobuf/util/json_util.h>

#include "loadopts/errors.hpp"
#include "json_detail.hpp"

namespace loadopts::json
{
    using namespace detail;

    namespace
    {
        using FieldMap = google::protobuf::Map<std::string, Value>;

        /* --------------------------------------------------------------------
         * Nullable scalars
         * ------------------------------------------------------------------ */

        Value scalar_value(bool v) { return make_bool(v); }
        Value scalar_value(std::int64_t v) { return make_int(v); }
        Value scalar_value(const std::string& v) { return make_string(v); }
        Value scalar_value(Duration v) { return make_string(format_duration(v)); }

        void scalar_from(const Value& value, std::string_view path, bool& out)
        {
            out = as_bool(value, path);
        }

        void scalar_from(const Value& value, std::string_view path, std::int64_t& out)
        {
            out = as_int(value, path);
        }

        void scalar_from(const Value& value, std::string_view path, std::string& out)
        {
            out = as_string(value, path);
        }

        void scalar_from(const Value& value, std::string_view path, Duration& out)
        {
            try
            {
                out = parse_duration(as_string(value, path));
            }
            catch (const ParseError& ex)
            {
                value_error(path, ex.what());
            }
        }

        template <typename T>
        void put(FieldMap& fields, const char* key, const Nullable<T>& field)
        {
            if (field.valid)
                fields[key] = scalar_value(field.value);
        }

        template <typename T>
        void get(const Struct& object, std::string_view key, std::string_view path, Nullable<T>& field)
        {
            const Value* value = find(object, key);
            if (!value)
                return;
            if (value->kind_case() == Value::kNullValue)
            {
                field.reset();
                return;
            }

            T parsed{};
            scalar_from(*value, member_path(path, key), parsed);
            field = std::move(parsed);
        }

        // Calls fn(value, path) for a present, non-null field; null clears via reset().
        template <typename Fn, typename Reset>
        void get_structured(const Struct& object, std::string_view key, Fn fn, Reset reset)
        {
            const Value* value = find(object, key);
            if (!value)
                return;
            if (value->kind_case() == Value::kNullValue)
            {
                reset();
                return;
            }
            fn(*value, std::string(key));
        }

        template <typename T, typename Fn>
        std::vector<T> list_from(const Value& value, std::string_view path, Fn fn)
        {
            const auto& list = as_list(value, path);
            std::vector<T> out;
            out.reserve(static_cast<std::size_t>(list.values_size()));
            for (int i = 0; i < list.values_size(); ++i)
                out.push_back(fn(list.values(i), index_path(path, i)));
            return out;
        }

        /* --------------------------------------------------------------------
         * Maps
         * ------------------------------------------------------------------ */

        Value hosts_value(const Hosts& hosts)
        {
            Value value;
            auto& fields = *value.mutable_struct_value()->mutable_fields();
            for (const auto& [host, ip] : hosts)
                fields[host] = make_string(ip);
            return value;
        }

        Hosts hosts_from(const Value& value, std::string_view path)
        {
            Hosts hosts;
            for (const auto& [host, ip] : as_object(value, path).fields())
            {
                const auto item_path = member_path(path, host);
                try
                {
                    hosts[host] = parse_ip(as_string(ip, item_path));
                }
                catch (const ParseError& ex)
                {
                    value_error(item_path, ex.what());
                }
            }
            return hosts;
        }

        Value thresholds_value(const ThresholdMap& thresholds)
        {
            Value value;
            auto& fields = *value.mutable_struct_value()->mutable_fields();
            for (const auto& [metric, set] : thresholds)
            {
                Value list;
                auto* items = list.mutable_list_value();
                for (const auto& threshold : set.thresholds)
                    *items->add_values() = make_string(threshold.source);
                fields[metric] = std::move(list);
            }
            return value;
        }

        ThresholdMap thresholds_from(const Value& value, std::string_view path)
        {
            ThresholdMap thresholds;
            for (const auto& [metric, list] : as_object(value, path).fields())
            {
                Thresholds set;
                set.thresholds = list_from<Threshold>(list, member_path(path, metric),
                                                      [](const Value& item, const std::string& item_path)
                                                      {
                                                          return Threshold{as_string(item, item_path)};
                                                      });
                thresholds.emplace(metric, std::move(set));
            }
            return thresholds;
        }

        Value external_value(const External& external)
        {
            Value value;
            auto& fields = *value.mutable_struct_value()->mutable_fields();
            for (const auto& [key, item] : external)
                fields[key] = item;
            return value;
        }

        External external_from(const Value& value, std::string_view path)
        {
            External external;
            for (const auto& [key, item] : as_object(value, path).fields())
                external.emplace(key, item);
            return external;
        }

        IPNet cidr_from(const Value& value, const std::string& path)
        {
            try
            {
                return parse_cidr(as_string(value, path));
            }
            catch (const ParseError& ex)
            {
                value_error(path, ex.what());
            }
        }

    } // namespace

    /* ========================================================================
     * Stage
     * ====================================================================== */

    Value to_value(const Stage& stage)
    {
        Value value;
        auto& fields = *value.mutable_struct_value()->mutable_fields();
        put(fields, "duration", stage.duration);
        put(fields, "target", stage.target);
        return value;
    }

    Stage stage_from_value(const Value& value, std::string_view path)
    {
        const auto& object = as_object(value, path);
        Stage stage;
        get(object, "duration", path, stage.duration);
        get(object, "target", path, stage.target);
        return stage;
    }

    /* ========================================================================
     * Options
     * ====================================================================== */

    Struct to_struct(const Options& opts)
    {
        Struct object;
        auto& fields = *object.mutable_fields();

        put(fields, "paused", opts.paused);
        put(fields, "vus", opts.vus);
        put(fields, "vusMax", opts.vus_max);
        put(fields, "duration", opts.duration);
        put(fields, "iterations", opts.iterations);
        if (!opts.stages.empty())
        {
            Value list;
            for (const auto& stage : opts.stages)
                *list.mutable_list_value()->add_values() = to_value(stage);
            fields["stages"] = std::move(list);
        }

        put(fields, "linger", opts.linger);
        put(fields, "noUsageReport", opts.no_usage_report);

        put(fields, "maxRedirects", opts.max_redirects);
        put(fields, "insecureSkipTLSVerify", opts.insecure_skip_tls_verify);
        if (opts.tls_cipher_suites)
            fields["tlsCipherSuites"] = to_value(*opts.tls_cipher_suites);
        if (opts.tls_version)
            fields["tlsVersion"] = to_value(*opts.tls_version);
        if (!opts.tls_auth.empty())
        {
            Value list;
            for (std::size_t i = 0; i < opts.tls_auth.size(); ++i)
            {
                if (!opts.tls_auth[i])
                    throw Error("cannot encode tlsAuth[" + std::to_string(i) + "]: entry is null");
                *list.mutable_list_value()->add_values() = to_value(*opts.tls_auth[i]);
            }
            fields["tlsAuth"] = std::move(list);
        }
        put(fields, "noConnectionReuse", opts.no_connection_reuse);
        put(fields, "userAgent", opts.user_agent);
        put(fields, "throw", opts.throw_errors);

        if (!opts.blacklist_ips.empty())
        {
            Value list;
            for (const auto& net : opts.blacklist_ips)
                *list.mutable_list_value()->add_values() = make_string(net.to_string());
            fields["blacklistIPs"] = std::move(list);
        }
        if (opts.hosts)
            fields["hosts"] = hosts_value(*opts.hosts);

        if (opts.thresholds)
            fields["thresholds"] = thresholds_value(*opts.thresholds);

        if (opts.external)
            fields["ext"] = external_value(*opts.external);

        return object;
    }

    void from_struct(const Struct& object, Options& target)
    {
        Options opts = target;

        get(object, "paused", "", opts.paused);
        get(object, "vus", "", opts.vus);
        get(object, "vusMax", "", opts.vus_max);
        get(object, "duration", "", opts.duration);
        get(object, "iterations", "", opts.iterations);
        get_structured(
            object, "stages",
            [&](const Value& v, const std::string& path) { opts.stages = list_from<Stage>(v, path, stage_from_value); },
            [&] { opts.stages.clear(); });

        get(object, "linger", "", opts.linger);
        get(object, "noUsageReport", "", opts.no_usage_report);

        get(object, "maxRedirects", "", opts.max_redirects);
        get(object, "insecureSkipTLSVerify", "", opts.insecure_skip_tls_verify);
        get_structured(
            object, "tlsCipherSuites",
            [&](const Value& v, const std::string& path) { opts.tls_cipher_suites = tls_cipher_suites_from_value(v, path); },
            [&] { opts.tls_cipher_suites.reset(); });
        get_structured(
            object, "tlsVersion",
            [&](const Value& v, const std::string& path) { opts.tls_version = tls_versions_from_value(v, path); },
            [&] { opts.tls_version.reset(); });
        get_structured(
            object, "tlsAuth",
            [&](const Value& v, const std::string& path) { opts.tls_auth = list_from<TLSAuthPtr>(v, path, tls_auth_from_value); },
            [&] { opts.tls_auth.clear(); });
        get(object, "noConnectionReuse", "", opts.no_connection_reuse);
        get(object, "userAgent", "", opts.user_agent);
        get(object, "throw", "", opts.throw_errors);

        get_structured(
            object, "blacklistIPs",
            [&](const Value& v, const std::string& path) { opts.blacklist_ips = list_from<IPNet>(v, path, cidr_from); },
            [&] { opts.blacklist_ips.clear(); });
        get_structured(
            object, "hosts",
            [&](const Value& v, const std::string& path) { opts.hosts = hosts_from(v, path); },
            [&] { opts.hosts.reset(); });

        get_structured(
            object, "thresholds",
            [&](const Value& v, const std::string& path) { opts.thresholds = thresholds_from(v, path); },
            [&] { opts.thresholds.reset(); });

        get_structured(
            object, "ext",
            [&](const Value& v, const std::string& path) { opts.external = external_from(v, path); },
            [&] { opts.external.reset(); });

        target = std::move(opts);
    }

    /* ========================================================================
     * Text
     * ====================================================================== */

    namespace
    {
        template <typename Message>
        void parse_text(std::string_view text, Message& message)
        {
            const auto status = google::protobuf::util::JsonStringToMessage(std::string(text), &message);
            if (!status.ok())
                throw DecodeError("malformed JSON: " + status.ToString());
        }

        template <typename Message>
        std::string print_text(const Message& message)
        {
            std::string out;
            const auto status = google::protobuf::util::MessageToJsonString(message, &out);
            if (!status.ok())
                throw Error("cannot encode JSON: " + status.ToString());
            return out;
        }

    } // namespace

    std::string encode(const Options& opts)
    {
        return print_text(to_struct(opts));
    }

    Options decode(std::string_view text)
    {
        Options opts;
        decode_into(text, opts);
        return opts;
    }

    void decode_into(std::string_view text, Options& target)
    {
        Struct object;
        parse_text(text, object);
        from_struct(object, target);
    }

    std::string encode(const TLSVersions& versions)
    {
        return print_text(to_value(versions).struct_value());
    }

    TLSVersions decode_tls_versions(std::string_view text)
    {
        // the top level must be an object; wrap so string forms parse too
        Struct wrapper;
        parse_text("{\"v\":" + std::string(text) + "}", wrapper);
        const Value* value = find(wrapper, "v");
        if (!value)
            throw DecodeError("malformed JSON: missing TLS version");
        return tls_versions_from_value(*value, "tlsVersion");
    }

} // namespace loadopts::json
