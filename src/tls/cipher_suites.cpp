#include "loadopts/tls.hpp"

#include <unordered_map>

namespace loadopts
{
    const std::map<std::string, TLSCipherSuite, std::less<>>& supported_tls_cipher_suites()
    {
        static const std::map<std::string, TLSCipherSuite, std::less<>> suites = {
            {"TLS_RSA_WITH_RC4_128_SHA", 0x0005},
            {"TLS_RSA_WITH_3DES_EDE_CBC_SHA", 0x000a},
            {"TLS_RSA_WITH_AES_128_CBC_SHA", 0x002f},
            {"TLS_RSA_WITH_AES_256_CBC_SHA", 0x0035},
            {"TLS_RSA_WITH_AES_128_CBC_SHA256", 0x003c},
            {"TLS_RSA_WITH_AES_128_GCM_SHA256", 0x009c},
            {"TLS_RSA_WITH_AES_256_GCM_SHA384", 0x009d},
            {"TLS_ECDHE_ECDSA_WITH_RC4_128_SHA", 0xc007},
            {"TLS_ECDHE_ECDSA_WITH_AES_128_CBC_SHA", 0xc009},
            {"TLS_ECDHE_ECDSA_WITH_AES_256_CBC_SHA", 0xc00a},
            {"TLS_ECDHE_RSA_WITH_RC4_128_SHA", 0xc011},
            {"TLS_ECDHE_RSA_WITH_3DES_EDE_CBC_SHA", 0xc012},
            {"TLS_ECDHE_RSA_WITH_AES_128_CBC_SHA", 0xc013},
            {"TLS_ECDHE_RSA_WITH_AES_256_CBC_SHA", 0xc014},
            {"TLS_ECDHE_ECDSA_WITH_AES_128_CBC_SHA256", 0xc023},
            {"TLS_ECDHE_RSA_WITH_AES_128_CBC_SHA256", 0xc027},
            {"TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256", 0xc02f},
            {"TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256", 0xc02b},
            {"TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384", 0xc030},
            {"TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384", 0xc02c},
            {"TLS_ECDHE_RSA_WITH_CHACHA20_POLY1305", 0xcca8},
            {"TLS_ECDHE_ECDSA_WITH_CHACHA20_POLY1305", 0xcca9},
        };
        return suites;
    }

    std::optional<TLSCipherSuite> cipher_suite_id(std::string_view name)
    {
        const auto& suites = supported_tls_cipher_suites();
        auto it = suites.find(name);
        if (it == suites.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<std::string_view> cipher_suite_name(TLSCipherSuite id)
    {
        // reverse index over the same table
        static const std::unordered_map<TLSCipherSuite, std::string_view> names = []
        {
            std::unordered_map<TLSCipherSuite, std::string_view> index;
            for (const auto& [name, suite] : supported_tls_cipher_suites())
                index.emplace(suite, name);
            return index;
        }();

        auto it = names.find(id);
        if (it == names.end())
            return std::nullopt;
        return it->second;
    }

} // namespace loadopts
