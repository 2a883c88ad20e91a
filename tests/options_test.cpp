#include <chrono>
#include <string>

#include "loadopts/options.hpp"
#include "test_helpers.hpp"
#include "tls_fixtures.hpp"

using namespace loadopts;
using namespace std::chrono_literals;

namespace
{
    google::protobuf::Value number(double n)
    {
        google::protobuf::Value v;
        v.set_number_value(n);
        return v;
    }

    // Every field set to something non-default.
    Options populated()
    {
        Options opts;
        opts.paused = true;
        opts.vus = 10;
        opts.vus_max = 20;
        opts.duration = Duration(30s);
        opts.iterations = 100;
        opts.stages = {Stage{null_duration(10s), null_int(5)}};
        opts.linger = true;
        opts.no_usage_report = true;
        opts.max_redirects = 3;
        opts.insecure_skip_tls_verify = true;
        opts.tls_cipher_suites = TLSCipherSuites{0xc02f};
        opts.tls_version = TLSVersions{TLSVersion::TLS11, TLSVersion::TLS12};
        opts.tls_auth = {make_tls_auth({{"example.com"}, fixtures::kUser1Cert, fixtures::kUser1Key})};
        opts.no_connection_reuse = true;
        opts.user_agent = std::string("base-agent");
        opts.throw_errors = true;
        opts.blacklist_ips = {parse_cidr("10.0.0.0/8")};
        opts.hosts = Hosts{{"test.example.com", "192.0.2.1"}};
        opts.thresholds = ThresholdMap{{"http_req_duration", Thresholds{{Threshold{"p(95)<500"}}}}};
        opts.external = External{{"a", number(1)}};
        return opts;
    }
}

static void test_scalar_overrides()
{
    TEST_START("scalar fields take the patch value");

    Options patch;
    patch.paused = true;
    patch.vus = 12345;
    patch.vus_max = 12345;
    patch.duration = Duration(2min);
    patch.iterations = 1234;
    patch.max_redirects = 12345;
    patch.insecure_skip_tls_verify = true;
    patch.no_connection_reuse = true;
    patch.user_agent = std::string("Hi!");
    patch.throw_errors = true;
    patch.linger = true;
    patch.no_usage_report = true;

    const Options opts = Options{}.apply(patch);
    TEST_ASSERT(opts.paused == null_bool(true), "paused");
    TEST_ASSERT(opts.vus == null_int(12345), "vus");
    TEST_ASSERT(opts.vus_max == null_int(12345), "vusMax");
    TEST_ASSERT_STR_EQ(format_duration(opts.duration.value), "2m0s", "duration");
    TEST_ASSERT(opts.duration.valid, "duration present");
    TEST_ASSERT(opts.iterations == null_int(1234), "iterations");
    TEST_ASSERT(opts.max_redirects == null_int(12345), "maxRedirects");
    TEST_ASSERT(opts.insecure_skip_tls_verify == null_bool(true), "insecureSkipTLSVerify");
    TEST_ASSERT(opts.no_connection_reuse == null_bool(true), "noConnectionReuse");
    TEST_ASSERT(opts.user_agent == null_string("Hi!"), "userAgent");
    TEST_ASSERT(opts.throw_errors == null_bool(true), "throw");
    TEST_ASSERT(opts.linger == null_bool(true), "linger");
    TEST_ASSERT(opts.no_usage_report == null_bool(true), "noUsageReport");
}

static void test_explicit_zero_overrides()
{
    TEST_START("explicit zero values still patch");

    Options patch;
    patch.vus = 0;
    patch.paused = false;
    patch.user_agent = std::string();

    const Options opts = populated().apply(patch);
    TEST_ASSERT(opts.vus == null_int(0), "vus overridden by 0");
    TEST_ASSERT(opts.paused == null_bool(false), "paused overridden by false");
    TEST_ASSERT(opts.user_agent == null_string(""), "user agent overridden by empty");
}

static void test_structured_overrides()
{
    TEST_START("structured fields take the patch value");

    Options patch;
    patch.stages = {Stage{null_duration(1s), NullInt{}}};
    patch.tls_cipher_suites = TLSCipherSuites{0x002f};
    patch.tls_version = TLSVersions{TLSVersion::SSL30, TLSVersion::TLS12};
    patch.hosts = Hosts{{"test.loadimpact.com", "192.0.2.1"}};
    patch.thresholds = ThresholdMap{{"metric", Thresholds{{Threshold{}}}}};
    patch.external = External{{"a", number(1)}};

    const Options opts = Options{}.apply(patch);
    TEST_ASSERT_INT_EQ(opts.stages.size(), 1, "one stage");
    TEST_ASSERT(opts.stages[0].duration == null_duration(1s), "stage duration");
    TEST_ASSERT(opts.tls_cipher_suites && opts.tls_cipher_suites->size() == 1 &&
                    (*opts.tls_cipher_suites)[0] == 0x002f,
                "cipher suites");
    TEST_ASSERT(opts.tls_version && opts.tls_version->min == TLSVersion::SSL30 &&
                    opts.tls_version->max == TLSVersion::TLS12,
                "tls version");
    TEST_ASSERT(opts.hosts && opts.hosts->at("test.loadimpact.com") == "192.0.2.1", "hosts");
    TEST_ASSERT(opts.thresholds && !opts.thresholds->empty(), "thresholds");
    TEST_ASSERT(opts.external && opts.external->at("a").number_value() == 1, "ext");
}

static void test_identity()
{
    TEST_START("empty patch leaves base unchanged");

    const Options base = populated();
    TEST_ASSERT(base.apply(Options{}) == base, "populated base");
    TEST_ASSERT(Options{}.apply(Options{}) == Options{}, "empty base");
    TEST_ASSERT(default_options().apply(Options{}) == default_options(), "defaults");
}

static void test_whole_value_replacement()
{
    TEST_START("lists and maps are replaced, never merged");

    const Options base = populated();

    Options patch;
    patch.stages = {Stage{null_duration(1s), NullInt{}}, Stage{null_duration(2s), null_int(7)}};
    patch.tls_auth = {make_tls_auth({{"other.org"}, fixtures::kUser2Cert, fixtures::kUser2Key})};
    patch.hosts = Hosts{{"other.example.com", "198.51.100.7"}};
    patch.external = External{{"b", number(2)}};
    patch.blacklist_ips = {parse_cidr("192.168.0.0/16")};

    const Options opts = base.apply(patch);
    TEST_ASSERT_INT_EQ(opts.stages.size(), 2, "stages replaced, not appended");
    TEST_ASSERT(opts.stages == patch.stages, "stages equal patch");
    TEST_ASSERT_INT_EQ(opts.tls_auth.size(), 1, "tls auth replaced");
    TEST_ASSERT(opts.tls_auth[0] == patch.tls_auth[0], "tls auth entry from patch");
    TEST_ASSERT(opts.hosts->count("test.example.com") == 0, "base host dropped");
    TEST_ASSERT_INT_EQ(opts.hosts->size(), 1, "only patch hosts");
    TEST_ASSERT(opts.external->count("a") == 0, "base ext key dropped");
    TEST_ASSERT(opts.blacklist_ips == patch.blacklist_ips, "blacklist replaced");

    Options empty_map;
    empty_map.hosts = Hosts{};
    TEST_ASSERT(base.apply(empty_map).hosts->empty(), "engaged empty map still replaces");
}

static void test_operands_untouched()
{
    TEST_START("apply does not modify its operands");

    const Options base = populated();
    Options base_copy = populated();
    base_copy.tls_auth = base.tls_auth;

    Options patch;
    patch.vus = 99;
    patch.stages = {Stage{null_duration(5s), NullInt{}}};

    const Options patch_copy = patch;
    const Options merged = base.apply(patch);

    TEST_ASSERT(base == base_copy, "base unchanged");
    TEST_ASSERT(patch == patch_copy, "patch unchanged");
    TEST_ASSERT(merged.vus == null_int(99), "merged picked patch");
    TEST_ASSERT(base.vus == null_int(10), "base kept its value");
}

static void test_equality()
{
    TEST_START("equality of aggregates");

    Options a = populated();
    Options b = populated();
    TEST_ASSERT(a == b, "auth entries compare by fields, not identity");

    b.tls_auth = {make_tls_auth({{"example.com"}, fixtures::kUser2Cert, fixtures::kUser2Key})};
    TEST_ASSERT(!(a == b), "different auth fields");

    Options c = populated();
    c.external = External{{"a", number(2)}};
    TEST_ASSERT(!(a == c), "ext compares values");

    Options d = populated();
    d.hosts.reset();
    TEST_ASSERT(!(a == d), "absent map differs from present map");
}

static void test_defaults()
{
    TEST_START("default_options");

    const Options opts = default_options();
    TEST_ASSERT(opts.vus == null_int(1), "vus default");
    TEST_ASSERT(opts.vus_max == null_int(1), "vusMax default");
    TEST_ASSERT(opts.max_redirects == null_int(10), "maxRedirects default");
    TEST_ASSERT(opts.paused == null_bool(false), "paused default");
    TEST_ASSERT(!opts.duration.valid, "duration left unset");
    TEST_ASSERT(!opts.tls_version.has_value(), "tls version left unset");
}

int main()
{
    TEST_SUITE_START("Options");

    test_scalar_overrides();
    test_explicit_zero_overrides();
    test_structured_overrides();
    test_identity();
    test_whole_value_replacement();
    test_operands_untouched();
    test_equality();
    test_defaults();

    TEST_SUITE_END();
    return TEST_RESULT();
}
