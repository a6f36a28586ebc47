#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "Errors.h"
#include "Resolver.h"
#include "test_support.h"

using namespace std::chrono_literals;

namespace {

class ResolverTest : public ::testing::Test {
protected:
    Resolver make_resolver(const std::vector<std::string>& entries,
                           std::chrono::milliseconds timeout = 300ms,
                           std::chrono::seconds max_ttl = 300s) {
        std::vector<ResolverEndpoint> endpoints;
        for (const auto& entry : entries) {
            endpoints.push_back(ResolverEndpoint::parse(entry));
        }
        return Resolver(endpoints, timeout, max_ttl, logger_);
    }

    std::string closed_nameserver() const {
        return "127.0.0.1:" + std::to_string(test::unused_udp_port());
    }

    Logger logger_{LogLevel::CRITICAL};
};

} // namespace

TEST_F(ResolverTest, LiteralAddressesBypassResolution) {
    test::MockDnsServer dns(test::DnsRecords{});
    Resolver resolver = make_resolver({dns.endpoint()});
    EXPECT_EQ(resolver.resolve("10.1.2.3"), *IpAddress::parse("10.1.2.3"));
    EXPECT_EQ(resolver.resolve("::1"), *IpAddress::parse("::1"));
    EXPECT_EQ(dns.queries(), 0);
}

TEST_F(ResolverTest, AnswerFromNameserver) {
    test::MockDnsServer dns(test::DnsRecords{{"example.test", "192.0.2.10"}});
    Resolver resolver = make_resolver({dns.endpoint()});
    EXPECT_EQ(resolver.resolve("example.test").to_string(), "192.0.2.10");
    EXPECT_EQ(dns.queries(), 1);
}

TEST_F(ResolverTest, FirstResolverThatAnswersWins) {
    test::MockDnsServer first(test::DnsRecords{{"example.test", "192.0.2.1"}});
    test::MockDnsServer second(test::DnsRecords{{"example.test", "192.0.2.2"}});
    Resolver resolver = make_resolver({first.endpoint(), second.endpoint()});
    EXPECT_EQ(resolver.resolve("example.test").to_string(), "192.0.2.1");
    EXPECT_EQ(second.queries(), 0);
}

TEST_F(ResolverTest, FallsBackAfterTimeout) {
    test::MockDnsServer silent(test::DnsRecords{{"example.test", "192.0.2.1"}}, 60, true);
    test::MockDnsServer backup(test::DnsRecords{{"example.test", "192.0.2.2"}});
    Resolver resolver = make_resolver({silent.endpoint(), backup.endpoint()}, 200ms);

    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(resolver.resolve("example.test").to_string(), "192.0.2.2");
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(silent.queries(), 1);
    EXPECT_GE(elapsed, 200ms);
    EXPECT_LT(elapsed, 2s);
}

TEST_F(ResolverTest, FallsBackAfterUnreachableNameserver) {
    test::MockDnsServer backup(test::DnsRecords{{"example.test", "192.0.2.2"}});
    Resolver resolver = make_resolver({closed_nameserver(), backup.endpoint()});
    EXPECT_EQ(resolver.resolve("example.test").to_string(), "192.0.2.2");
}

TEST_F(ResolverTest, FallsBackAfterNxdomain) {
    test::MockDnsServer empty(test::DnsRecords{});
    test::MockDnsServer backup(test::DnsRecords{{"example.test", "192.0.2.2"}});
    Resolver resolver = make_resolver({empty.endpoint(), backup.endpoint()});
    EXPECT_EQ(resolver.resolve("example.test").to_string(), "192.0.2.2");
    EXPECT_EQ(empty.queries(), 1);
}

TEST_F(ResolverTest, AllResolversFail) {
    test::MockDnsServer empty(test::DnsRecords{});
    test::MockDnsServer silent(test::DnsRecords{}, 60, true);
    Resolver resolver = make_resolver({empty.endpoint(), closed_nameserver(), silent.endpoint()}, 150ms);
    try {
        resolver.resolve("missing.test");
        FAIL() << "expected DnsResolutionFailed";
    } catch (const DnsResolutionFailed& e) {
        EXPECT_EQ(e.hostname(), "missing.test");
    }
    EXPECT_EQ(empty.queries(), 1);
    EXPECT_EQ(silent.queries(), 1);
    EXPECT_EQ(resolver.cache_size(), 0u);
}

TEST_F(ResolverTest, AnswersAreCachedWithinTtl) {
    test::MockDnsServer dns(test::DnsRecords{{"cached.test", "198.51.100.7"}}, 120);
    Resolver resolver = make_resolver({dns.endpoint()});
    EXPECT_EQ(resolver.resolve("cached.test").to_string(), "198.51.100.7");
    EXPECT_EQ(resolver.resolve("cached.test").to_string(), "198.51.100.7");
    EXPECT_EQ(dns.queries(), 1);
    EXPECT_EQ(resolver.cache_size(), 1u);

    resolver.clear_cache();
    EXPECT_EQ(resolver.resolve("cached.test").to_string(), "198.51.100.7");
    EXPECT_EQ(dns.queries(), 2);
}

TEST_F(ResolverTest, ZeroTtlIsNotCached) {
    test::MockDnsServer dns(test::DnsRecords{{"volatile.test", "198.51.100.8"}}, 0);
    Resolver resolver = make_resolver({dns.endpoint()});
    resolver.resolve("volatile.test");
    resolver.resolve("volatile.test");
    EXPECT_EQ(dns.queries(), 2);
    EXPECT_EQ(resolver.cache_size(), 0u);
}

TEST_F(ResolverTest, CacheDisabledByZeroMaxTtl) {
    test::MockDnsServer dns(test::DnsRecords{{"example.test", "198.51.100.9"}}, 3600);
    Resolver resolver = make_resolver({dns.endpoint()}, 300ms, 0s);
    resolver.resolve("example.test");
    resolver.resolve("example.test");
    EXPECT_EQ(dns.queries(), 2);
}

TEST_F(ResolverTest, CacheExpiresAfterCappedTtl) {
    test::MockDnsServer dns(test::DnsRecords{{"example.test", "198.51.100.9"}}, 3600);
    Resolver resolver = make_resolver({dns.endpoint()}, 300ms, 1s);
    resolver.resolve("example.test");
    std::this_thread::sleep_for(1100ms);
    resolver.resolve("example.test");
    EXPECT_EQ(dns.queries(), 2);
}

TEST_F(ResolverTest, SystemResolverHandlesLocalhost) {
    Resolver resolver = make_resolver({"system"}, 2000ms);
    IpAddress address = resolver.resolve("localhost");
    EXPECT_TRUE(address == *IpAddress::parse("127.0.0.1") || address == *IpAddress::parse("::1"))
        << address.to_string();
    // getaddrinfo answers carry no TTL
    EXPECT_EQ(resolver.cache_size(), 0u);
}

TEST_F(ResolverTest, ConcurrentLookups) {
    test::MockDnsServer dns(test::DnsRecords{{"a.test", "203.0.113.1"}, {"b.test", "203.0.113.2"}});
    Resolver resolver = make_resolver({dns.endpoint()});

    std::vector<std::thread> threads;
    std::atomic<int> mismatches{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&resolver, &mismatches, i]() {
            const bool a = i % 2 == 0;
            std::string got = resolver.resolve(a ? "a.test" : "b.test").to_string();
            if (got != (a ? "203.0.113.1" : "203.0.113.2")) {
                mismatches++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
}

TEST_F(ResolverTest, CacheSizeIsBounded) {
    test::DnsRecords records;
    for (int i = 0; i < 20; ++i) {
        records["host" + std::to_string(i) + ".test"] = "198.51.100." + std::to_string(i + 1);
    }
    test::MockDnsServer dns(records, 60);
    Resolver resolver = make_resolver({dns.endpoint()});
    resolver.set_cache_limit(8);

    for (int i = 0; i < 20; ++i) {
        resolver.resolve("host" + std::to_string(i) + ".test");
        EXPECT_LE(resolver.cache_size(), 8u);
    }
    EXPECT_EQ(dns.queries(), 20);

    // the newest answer survives eviction
    EXPECT_EQ(resolver.resolve("host19.test").to_string(), "198.51.100.20");
    EXPECT_EQ(dns.queries(), 20);
}

TEST_F(ResolverTest, ExpiredEntriesAreSweptWhenFull) {
    test::MockDnsServer short_lived(test::DnsRecords{{"a.test", "203.0.113.1"}, {"b.test", "203.0.113.2"}}, 1);
    test::MockDnsServer long_lived(test::DnsRecords{{"c.test", "203.0.113.3"}}, 600);
    Resolver resolver = make_resolver({short_lived.endpoint(), long_lived.endpoint()});
    resolver.set_cache_limit(2);

    resolver.resolve("a.test");
    resolver.resolve("b.test");
    EXPECT_EQ(resolver.cache_size(), 2u);
    std::this_thread::sleep_for(1100ms);

    resolver.resolve("c.test");
    EXPECT_EQ(resolver.cache_size(), 1u);
}

TEST_F(ResolverTest, ZeroCacheLimitDisablesCaching) {
    test::MockDnsServer dns(test::DnsRecords{{"example.test", "198.51.100.9"}}, 3600);
    Resolver resolver = make_resolver({dns.endpoint()});
    resolver.set_cache_limit(0);
    resolver.resolve("example.test");
    resolver.resolve("example.test");
    EXPECT_EQ(dns.queries(), 2);
    EXPECT_EQ(resolver.cache_size(), 0u);
}
