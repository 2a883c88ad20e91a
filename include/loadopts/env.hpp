#pragma once

#include <map>
#include <string>
#include <string_view>

#include "loadopts/options.hpp"

namespace loadopts
{
    inline constexpr std::string_view kDefaultEnvPrefix = "K6";

    /// Snapshot of environment variables.
    class Environment
    {
      public:
        Environment() = default;
        explicit Environment(std::map<std::string, std::string> vars);

        /// Copies the current process environment.
        static Environment from_process();

        void set(std::string name, std::string value);
        void unset(std::string_view name);

        /// nullptr when the variable is not set at all.
        const std::string* lookup(std::string_view name) const;

      private:
        std::map<std::string, std::string, std::less<>> vars_;
    };

    /**
     * @brief Variable name for an option, from its JSON field name.
     *
     * The camelCase name is split before each word and acronym, upper-cased
     * and joined with underscores: ("K6", "vusMax") -> "K6_VUS_MAX",
     * ("K6", "insecureSkipTLSVerify") -> "K6_INSECURE_SKIP_TLS_VERIFY".
     */
    std::string env_var_name(std::string_view prefix, std::string_view field);

    /**
     * @brief Build Options from scalar environment variables.
     *
     * Unset and empty variables leave the option unset. Anything else must
     * parse as the field's type or BindingError is thrown. TLS structures,
     * hosts, thresholds and ext are never read from the environment.
     */
    Options options_from_env(const Environment& env, std::string_view prefix = kDefaultEnvPrefix);

} // namespace loadopts
