#include "loadopts/tls.hpp"

#include <climits>

#include <fmt/format.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>

#include "loadopts/errors.hpp"
#include "util/logger.hpp"

namespace loadopts
{
    namespace
    {
        struct BioDeleter
        {
            void operator()(BIO* bio) const noexcept { BIO_free(bio); }
        };

        using BioPtr = std::unique_ptr<BIO, BioDeleter>;

        BioPtr make_bio(const std::string& pem)
        {
            if (pem.size() > static_cast<std::size_t>(INT_MAX))
                throw CertificateError("PEM data too large");

            BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
            if (!bio)
                throw CertificateError("failed to allocate PEM buffer");
            return bio;
        }

        // Drains the OpenSSL error queue into a readable message.
        std::string openssl_errors()
        {
            std::string out;
            unsigned long code = 0;
            while ((code = ERR_get_error()) != 0)
            {
                char buf[256];
                ERR_error_string_n(code, buf, sizeof(buf));
                if (!out.empty())
                    out.append("; ");
                out.append(buf);
            }
            return out.empty() ? "unknown error" : out;
        }

        // Encrypted keys are not supported; refuse instead of prompting.
        int no_password(char*, int, int, void*)
        {
            return 0;
        }

        std::vector<X509Ptr> read_chain(const std::string& pem)
        {
            auto bio = make_bio(pem);
            std::vector<X509Ptr> chain;
            while (X509* cert = PEM_read_bio_X509(bio.get(), nullptr, no_password, nullptr))
                chain.emplace_back(cert);

            // the read loop always ends on an "no start line" error
            ERR_clear_error();

            if (chain.empty())
                throw CertificateError("failed to find any PEM certificate in cert data");
            return chain;
        }

        EvpPkeyPtr read_key(const std::string& pem)
        {
            auto bio = make_bio(pem);
            EvpPkeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, no_password, nullptr));
            if (!key)
                throw CertificateError("failed to parse private key: " + openssl_errors());
            return key;
        }

        std::shared_ptr<const Certificate> parse_certificate(const TLSAuthFields& fields)
        {
            ERR_clear_error();

            auto cert = std::make_shared<Certificate>();
            cert->chain = read_chain(fields.cert);
            cert->private_key = read_key(fields.key);

            if (X509_check_private_key(cert->leaf(), cert->private_key.get()) != 1)
            {
                const auto detail = openssl_errors();
                throw CertificateError("private key does not match certificate: " + detail);
            }
            return cert;
        }

    } // namespace

    TLSAuth::TLSAuth(TLSAuthFields fields)
        : fields_(std::move(fields))
    {
    }

    bool TLSAuth::matches(std::string_view host) const
    {
        for (const auto& pattern : fields_.domains)
        {
            if (domain_matches(pattern, host))
                return true;
        }
        return false;
    }

    std::shared_ptr<const Certificate> TLSAuth::certificate() const
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (cached_)
            return cached_;

        try
        {
            cached_ = parse_certificate(fields_);
        }
        catch (const CertificateError& ex)
        {
            util::warning("tls auth for [{}]: {}", fmt::join(fields_.domains, ", "), ex.what());
            throw;
        }
        return cached_;
    }

    TLSAuthPtr make_tls_auth(TLSAuthFields fields)
    {
        return std::make_shared<TLSAuth>(std::move(fields));
    }

    TLSAuthPtr find_tls_auth(const std::vector<TLSAuthPtr>& entries, std::string_view host)
    {
        for (const auto& entry : entries)
        {
            if (entry && entry->matches(host))
                return entry;
        }
        return nullptr;
    }

    bool domain_matches(std::string_view pattern, std::string_view host) noexcept
    {
        if (pattern == host)
            return true;

        if (pattern.size() > 2 && pattern.substr(0, 2) == "*.")
        {
            const auto suffix = pattern.substr(1); // ".example.com"
            return host.size() > suffix.size() &&
                   host.substr(host.size() - suffix.size()) == suffix;
        }
        return false;
    }

} // namespace loadopts
