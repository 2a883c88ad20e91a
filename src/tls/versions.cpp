#include "loadopts/tls.hpp"

namespace loadopts
{
    const std::map<std::string, TLSVersion, std::less<>>& supported_tls_versions()
    {
        static const std::map<std::string, TLSVersion, std::less<>> versions = {
            {"ssl3.0", TLSVersion::SSL30},
            {"tls1.0", TLSVersion::TLS10},
            {"tls1.1", TLSVersion::TLS11},
            {"tls1.2", TLSVersion::TLS12},
        };
        return versions;
    }

    std::optional<TLSVersion> tls_version_from_name(std::string_view name)
    {
        const auto& versions = supported_tls_versions();
        auto it = versions.find(name);
        if (it == versions.end())
            return std::nullopt;
        return it->second;
    }

    std::string_view tls_version_name(TLSVersion version)
    {
        for (const auto& [name, value] : supported_tls_versions())
        {
            if (value == version)
                return name;
        }
        return {};
    }

} // namespace loadopts
