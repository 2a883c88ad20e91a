#include "loadopts/env.hpp"

#include <cctype>
#include <cstdint>
#include <variant>

#include "loadopts/errors.hpp"
#include "util/logger.hpp"
#include "util/text.hpp"

extern char** environ;

namespace loadopts
{
    namespace
    {
        using Member = std::variant<NullBool Options::*,
                                    NullInt Options::*,
                                    NullDuration Options::*,
                                    NullString Options::*,
                                    std::vector<Stage> Options::*>;

        struct Binding
        {
            const char* field; // JSON name
            Member member;
        };

        const Binding kBindings[] = {
            {"paused", &Options::paused},
            {"vus", &Options::vus},
            {"vusMax", &Options::vus_max},
            {"duration", &Options::duration},
            {"iterations", &Options::iterations},
            {"stages", &Options::stages},
            {"linger", &Options::linger},
            {"noUsageReport", &Options::no_usage_report},
            {"maxRedirects", &Options::max_redirects},
            {"insecureSkipTLSVerify", &Options::insecure_skip_tls_verify},
            {"noConnectionReuse", &Options::no_connection_reuse},
            {"userAgent", &Options::user_agent},
            {"throw", &Options::throw_errors},
        };

        bool is_upper(char c) noexcept
        {
            return std::isupper(static_cast<unsigned char>(c)) != 0;
        }

        bool is_lower(char c) noexcept
        {
            return std::islower(static_cast<unsigned char>(c)) != 0;
        }

        // Same spellings strconv.ParseBool accepts.
        bool parse_bool(std::string_view text, bool& out) noexcept
        {
            if (text == "1" || text == "t" || text == "T" || text == "TRUE" || text == "true" || text == "True")
            {
                out = true;
                return true;
            }
            if (text == "0" || text == "f" || text == "F" || text == "FALSE" || text == "false" || text == "False")
            {
                out = false;
                return true;
            }
            return false;
        }

        struct Assign
        {
            Options& opts;
            const std::string& variable;
            const std::string& raw;

            void operator()(NullBool Options::*member) const
            {
                bool value = false;
                if (!parse_bool(raw, value))
                    throw BindingError(variable, raw, "expected a boolean");
                opts.*member = value;
            }

            void operator()(NullInt Options::*member) const
            {
                std::int64_t value = 0;
                if (!util::parse_int64(raw, value))
                    throw BindingError(variable, raw, "expected an integer");
                opts.*member = value;
            }

            void operator()(NullDuration Options::*member) const
            {
                try
                {
                    opts.*member = parse_duration(raw);
                }
                catch (const ParseError& ex)
                {
                    throw BindingError(variable, raw, ex.what());
                }
            }

            void operator()(NullString Options::*member) const
            {
                opts.*member = raw;
            }

            void operator()(std::vector<Stage> Options::*member) const
            {
                try
                {
                    opts.*member = parse_stages(raw);
                }
                catch (const ParseError& ex)
                {
                    throw BindingError(variable, raw, ex.what());
                }
            }
        };

    } // namespace

    /* ========================================================================
     * Environment
     * ====================================================================== */

    Environment::Environment(std::map<std::string, std::string> vars)
        : vars_(vars.begin(), vars.end())
    {
    }

    Environment Environment::from_process()
    {
        Environment env;
        for (char** entry = environ; entry && *entry; ++entry)
        {
            std::string_view pair(*entry);
            const auto eq = pair.find('=');
            if (eq == std::string_view::npos)
                continue;
            env.vars_.emplace(std::string(pair.substr(0, eq)), std::string(pair.substr(eq + 1)));
        }
        return env;
    }

    void Environment::set(std::string name, std::string value)
    {
        vars_.insert_or_assign(std::move(name), std::move(value));
    }

    void Environment::unset(std::string_view name)
    {
        auto it = vars_.find(name);
        if (it != vars_.end())
            vars_.erase(it);
    }

    const std::string* Environment::lookup(std::string_view name) const
    {
        auto it = vars_.find(name);
        if (it == vars_.end())
            return nullptr;
        return &it->second;
    }

    /* ========================================================================
     * Binding
     * ====================================================================== */

    std::string env_var_name(std::string_view prefix, std::string_view field)
    {
        std::string name(prefix);
        if (!name.empty())
            name.push_back('_');

        for (std::size_t i = 0; i < field.size(); ++i)
        {
            const char c = field[i];
            if (i > 0 && is_upper(c))
            {
                const char prev = field[i - 1];
                const bool next_lower = i + 1 < field.size() && is_lower(field[i + 1]);
                // "fooBar" -> FOO_BAR, "TLSVerify" -> TLS_VERIFY
                if (!is_upper(prev) || next_lower)
                    name.push_back('_');
            }
            name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
        return name;
    }

    Options options_from_env(const Environment& env, std::string_view prefix)
    {
        Options opts;
        for (const auto& binding : kBindings)
        {
            const auto variable = env_var_name(prefix, binding.field);
            const std::string* raw = env.lookup(variable);

            // empty counts as unset, for every type
            if (!raw || raw->empty())
                continue;

            std::visit(Assign{opts, variable, *raw}, binding.member);
            util::debug("bound {}={}", variable, *raw);
        }
        return opts;
    }

} // namespace loadopts
