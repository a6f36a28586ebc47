#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Logger.h"
#include "ProxyConfig.h"
#include "utils.h"

// Resolves hostnames by walking an ordered resolver chain. Each attempt is
// bounded by the per-resolver timeout; the first usable address wins.
// Safe to call from many connection threads at once.
class Resolver {
public:
    Resolver(std::vector<ResolverEndpoint> endpoints, std::chrono::milliseconds timeout,
             std::chrono::seconds cache_max_ttl, Logger& logger);
    Resolver(const ProxyConfig& config, Logger& logger);

    // Egress pinning for nameserver queries.
    void set_outbound(const std::string& address, const std::string& interface_name);

    // Literal IPv4/IPv6 addresses come back unchanged. Throws DnsResolutionFailed.
    IpAddress resolve(const std::string& hostname);

    // Entries kept at most; 0 disables the cache. Defaults to 4096.
    void set_cache_limit(size_t max_entries);

    size_t cache_size() const;
    void clear_cache();

private:
    struct Answer {
        IpAddress address;
        std::optional<std::chrono::seconds> ttl;
    };

    struct CacheEntry {
        IpAddress address;
        std::chrono::steady_clock::time_point expires;
    };

    std::optional<Answer> query_system(const std::string& hostname);
    std::optional<Answer> query_nameserver(const ResolverEndpoint& nameserver,
                                           const std::string& hostname);

    std::optional<IpAddress> cache_lookup(const std::string& hostname);
    void cache_store(const std::string& hostname, const Answer& answer);
    void cache_invalidate(const std::string& hostname);
    void cache_make_room(std::chrono::steady_clock::time_point now);

    std::vector<ResolverEndpoint> endpoints_;
    std::chrono::milliseconds timeout_;
    std::chrono::seconds cache_max_ttl_;
    size_t cache_max_entries_ = 4096;
    std::string outbound_address_;
    std::string outbound_interface_;
    Logger& logger_;

    mutable std::mutex cache_mutex_;
    std::unordered_map<std::string, CacheEntry> cache_;
};
