#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils.h"

// One entry of the resolver chain: "system", "1.1.1.1" or "1.1.1.1:5353".
struct ResolverEndpoint {
    bool system = false;
    IpAddress address;
    uint16_t port = 53;

    static ResolverEndpoint parse(const std::string& text);
    std::string to_string() const;
};

// Front end spoken on the listening socket.
enum class ProxyProtocol {
    SOCKS5,
    HTTP      // CONNECT tunnels and absolute-URI forwarding
};

const char* proxy_protocol_name(ProxyProtocol protocol);

struct ProxyConfig {
    ProxyProtocol protocol = ProxyProtocol::SOCKS5;
    std::string bind_address = "127.0.0.1";
    int port = 9050;
    int worker_count = default_worker_count();

    std::vector<ResolverEndpoint> dns_resolvers = default_resolvers();
    std::chrono::milliseconds dns_timeout{1000};
    std::chrono::seconds dns_cache_max_ttl{300};
    size_t dns_cache_max_entries = 4096;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds handshake_timeout{30000};
    std::chrono::milliseconds grace_period{5000};
    std::chrono::milliseconds stats_interval{250};

    // Egress pinning. Either may be empty.
    std::string outbound_address;
    std::string outbound_interface;

    // 0 restarts crashed workers forever.
    int max_restarts = 0;

    size_t relay_buffer_size = 4096;
    int listen_backlog = 1024;

    std::string log_level = "info";
    std::string log_file;

    // Upper bounds enforced by validate().
    static constexpr size_t MAX_RELAY_BUFFER_SIZE = 1024 * 1024;
    static constexpr std::chrono::milliseconds MAX_TIMEOUT{3600 * 1000};

    // One worker per CPU, at least one.
    static int default_worker_count();
    static std::vector<ResolverEndpoint> default_resolvers();

    // Missing keys keep their defaults. Throws InvalidConfig on wrong types
    // or unparsable resolver entries.
    static ProxyConfig from_json(const nlohmann::json& config);
    static ProxyConfig from_file(const std::string& path);

    // Throws InvalidConfig.
    void validate() const;
};

void to_json(nlohmann::json& j, const ProxyConfig& config);
