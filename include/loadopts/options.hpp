#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "loadopts/net.hpp"
#include "loadopts/nullable.hpp"
#include "loadopts/stage.hpp"
#include "loadopts/threshold.hpp"
#include "loadopts/tls.hpp"

namespace loadopts
{
    using Hosts = std::map<std::string, std::string>; // hostname -> canonical IP
    using ThresholdMap = std::map<std::string, Thresholds>;
    using External = std::map<std::string, google::protobuf::Value>;

    /**
     * @brief Every tunable parameter of a test run.
     *
     * Scalars are Nullable; lists are "unset" when empty; maps and TLS
     * structures are "unset" when disengaged. Instances are combined with
     * apply() and then handed out read-only.
     */
    struct Options
    {
        NullBool paused;
        NullInt vus;
        NullInt vus_max;
        NullDuration duration;
        NullInt iterations;
        std::vector<Stage> stages;

        NullBool linger;
        NullBool no_usage_report;

        NullInt max_redirects;
        NullBool insecure_skip_tls_verify;
        std::optional<TLSCipherSuites> tls_cipher_suites;
        std::optional<TLSVersions> tls_version;
        std::vector<TLSAuthPtr> tls_auth;
        NullBool no_connection_reuse;
        NullString user_agent;
        NullBool throw_errors;

        std::vector<IPNet> blacklist_ips;
        std::optional<Hosts> hosts;

        std::optional<ThresholdMap> thresholds;

        std::optional<External> external;

        /**
         * @brief Overlay `other` on top of this instance.
         *
         * Each field set in `other` replaces the whole field; nothing is
         * merged element-wise. Neither operand is modified.
         */
        Options apply(const Options& other) const;

        // TLS auth entries compare by their fields, ext values structurally.
        bool operator==(const Options& other) const;
    };

    /// Compiled-in defaults: vus=1, vusMax=1, maxRedirects=10, paused=false.
    Options default_options();

} // namespace loadopts
