#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>
#include <openssl/x509.h>

namespace loadopts
{
    /* ========================================================================
     * Protocol versions
     * ====================================================================== */

    // Values are the on-the-wire protocol version numbers.
    enum class TLSVersion : std::uint16_t
    {
        None = 0,
        SSL30 = 0x0300,
        TLS10 = 0x0301,
        TLS11 = 0x0302,
        TLS12 = 0x0303,
    };

    /// Inclusive [min, max] range. Both None means "library default".
    struct TLSVersions
    {
        TLSVersion min = TLSVersion::None;
        TLSVersion max = TLSVersion::None;

        bool empty() const noexcept { return min == TLSVersion::None && max == TLSVersion::None; }

        bool operator==(const TLSVersions&) const = default;
    };

    /// Canonical name -> version ("ssl3.0", "tls1.0", "tls1.1", "tls1.2").
    const std::map<std::string, TLSVersion, std::less<>>& supported_tls_versions();

    std::optional<TLSVersion> tls_version_from_name(std::string_view name);

    /// Canonical name, or an empty view for None / unknown values.
    std::string_view tls_version_name(TLSVersion version);

    /* ========================================================================
     * Cipher suites
     * ====================================================================== */

    using TLSCipherSuite = std::uint16_t;
    using TLSCipherSuites = std::vector<TLSCipherSuite>;

    /// IANA-style name -> suite id, built once per process.
    const std::map<std::string, TLSCipherSuite, std::less<>>& supported_tls_cipher_suites();

    std::optional<TLSCipherSuite> cipher_suite_id(std::string_view name);

    std::optional<std::string_view> cipher_suite_name(TLSCipherSuite id);

    /* ========================================================================
     * Client certificates
     * ====================================================================== */

    struct X509Deleter
    {
        void operator()(X509* cert) const noexcept { X509_free(cert); }
    };

    struct EvpPkeyDeleter
    {
        void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
    };

    using X509Ptr = std::unique_ptr<X509, X509Deleter>;
    using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

    /// Parsed certificate chain and its private key.
    struct Certificate
    {
        std::vector<X509Ptr> chain; // leaf first
        EvpPkeyPtr private_key;

        X509* leaf() const noexcept { return chain.empty() ? nullptr : chain.front().get(); }
    };

    struct TLSAuthFields
    {
        std::vector<std::string> domains; // "example.com" or "*.example.com"
        std::string cert;                 // PEM
        std::string key;                  // PEM

        bool operator==(const TLSAuthFields&) const = default;
    };

    /**
     * @brief Client certificate bundle selected by host name.
     *
     * certificate() parses the PEM text on first use and caches the result.
     * Concurrent first calls are serialized; a failed parse is not cached,
     * so a later call retries and fails the same way.
     */
    class TLSAuth
    {
      public:
        TLSAuth() = default;
        explicit TLSAuth(TLSAuthFields fields);

        TLSAuth(const TLSAuth&) = delete;
        TLSAuth& operator=(const TLSAuth&) = delete;

        const TLSAuthFields& fields() const noexcept { return fields_; }

        bool matches(std::string_view host) const;

        std::shared_ptr<const Certificate> certificate() const;

      private:
        TLSAuthFields fields_;

        mutable std::mutex mu_;
        mutable std::shared_ptr<const Certificate> cached_;
    };

    using TLSAuthPtr = std::shared_ptr<TLSAuth>;

    TLSAuthPtr make_tls_auth(TLSAuthFields fields);

    /// First entry whose domains match host, or nullptr.
    TLSAuthPtr find_tls_auth(const std::vector<TLSAuthPtr>& entries, std::string_view host);

    /// Exact match, or "*.suffix" matching any host ending in ".suffix".
    bool domain_matches(std::string_view pattern, std::string_view host) noexcept;

} // namespace loadopts
