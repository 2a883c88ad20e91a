#include "loadopts/options.hpp"

#include <algorithm>

#include <google/protobuf/util/message_differencer.h>

namespace loadopts
{
    namespace
    {
        template <typename T>
        void overlay(Nullable<T>& dst, const Nullable<T>& src)
        {
            if (src.valid)
                dst = src;
        }

        template <typename T>
        void overlay(std::optional<T>& dst, const std::optional<T>& src)
        {
            if (src)
                dst = src;
        }

        template <typename T>
        void overlay(std::vector<T>& dst, const std::vector<T>& src)
        {
            if (!src.empty())
                dst = src;
        }

        bool same_tls_auth(const std::vector<TLSAuthPtr>& a, const std::vector<TLSAuthPtr>& b)
        {
            return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                              [](const TLSAuthPtr& x, const TLSAuthPtr& y)
                              {
                                  if (!x || !y)
                                      return x == y;
                                  return x->fields() == y->fields();
                              });
        }

        bool same_external(const std::optional<External>& a, const std::optional<External>& b)
        {
            if (a.has_value() != b.has_value())
                return false;
            if (!a)
                return true;

            return std::equal(a->begin(), a->end(), b->begin(), b->end(),
                              [](const auto& x, const auto& y)
                              {
                                  return x.first == y.first &&
                                         google::protobuf::util::MessageDifferencer::Equals(x.second, y.second);
                              });
        }

    } // namespace

    Options Options::apply(const Options& other) const
    {
        Options out = *this;

        overlay(out.paused, other.paused);
        overlay(out.vus, other.vus);
        overlay(out.vus_max, other.vus_max);
        overlay(out.duration, other.duration);
        overlay(out.iterations, other.iterations);
        overlay(out.stages, other.stages);

        overlay(out.linger, other.linger);
        overlay(out.no_usage_report, other.no_usage_report);

        overlay(out.max_redirects, other.max_redirects);
        overlay(out.insecure_skip_tls_verify, other.insecure_skip_tls_verify);
        overlay(out.tls_cipher_suites, other.tls_cipher_suites);
        overlay(out.tls_version, other.tls_version);
        overlay(out.tls_auth, other.tls_auth);
        overlay(out.no_connection_reuse, other.no_connection_reuse);
        overlay(out.user_agent, other.user_agent);
        overlay(out.throw_errors, other.throw_errors);

        overlay(out.blacklist_ips, other.blacklist_ips);
        overlay(out.hosts, other.hosts);
        overlay(out.thresholds, other.thresholds);
        overlay(out.external, other.external);

        return out;
    }

    bool Options::operator==(const Options& other) const
    {
        return paused == other.paused &&
               vus == other.vus &&
               vus_max == other.vus_max &&
               duration == other.duration &&
               iterations == other.iterations &&
               stages == other.stages &&
               linger == other.linger &&
               no_usage_report == other.no_usage_report &&
               max_redirects == other.max_redirects &&
               insecure_skip_tls_verify == other.insecure_skip_tls_verify &&
               tls_cipher_suites == other.tls_cipher_suites &&
               tls_version == other.tls_version &&
               same_tls_auth(tls_auth, other.tls_auth) &&
               no_connection_reuse == other.no_connection_reuse &&
               user_agent == other.user_agent &&
               throw_errors == other.throw_errors &&
               blacklist_ips == other.blacklist_ips &&
               hosts == other.hosts &&
               thresholds == other.thresholds &&
               same_external(external, other.external);
    }

    Options default_options()
    {
        Options opts;
        opts.paused = false;
        opts.vus = 1;
        opts.vus_max = 1;
        opts.max_redirects = 10;
        return opts;
    }

} // namespace loadopts
