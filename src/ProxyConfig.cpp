#include "ProxyConfig.h"

#include <fstream>
#include <thread>
#include <net/if.h>

#include "Errors.h"

ResolverEndpoint ResolverEndpoint::parse(const std::string& text) {
    ResolverEndpoint endpoint;
    if (text == "system") {
        endpoint.system = true;
        return endpoint;
    }

    std::string host = text;
    size_t colon = text.rfind(':');
    // a single colon separates an IPv4 nameserver from its port
    if (colon != std::string::npos && text.find(':') == colon) {
        host = text.substr(0, colon);
        std::string port_text = text.substr(colon + 1);
        int port = 0;
        try {
            size_t used = 0;
            port = std::stoi(port_text, &used);
            if (used != port_text.size()) {
                throw InvalidConfig("Invalid resolver port in '" + text + "'");
            }
        } catch (const std::logic_error&) {
            throw InvalidConfig("Invalid resolver port in '" + text + "'");
        }
        if (port <= 0 || port > 65535) {
            throw InvalidConfig("Resolver port out of range in '" + text + "'");
        }
        endpoint.port = static_cast<uint16_t>(port);
    }

    auto address = IpAddress::parse(host);
    if (!address) {
        throw InvalidConfig("Resolver '" + text + "' is neither 'system' nor an IP address");
    }
    if (!address->is_v4()) {
        throw InvalidConfig("Resolver '" + text + "': only IPv4 nameservers are supported");
    }
    endpoint.address = *address;
    return endpoint;
}

std::string ResolverEndpoint::to_string() const {
    if (system) {
        return "system";
    }
    if (port == 53) {
        return address.to_string();
    }
    return address.to_string() + ":" + std::to_string(port);
}

const char* proxy_protocol_name(ProxyProtocol protocol) {
    switch (protocol) {
        case ProxyProtocol::SOCKS5: return "socks5";
        case ProxyProtocol::HTTP: return "http";
        default: return "unknown";
    }
}

namespace {

ProxyProtocol parse_protocol(const std::string& name) {
    if (name == "socks5") {
        return ProxyProtocol::SOCKS5;
    }
    if (name == "http") {
        return ProxyProtocol::HTTP;
    }
    throw InvalidConfig("protocol must be 'socks5' or 'http', got '" + name + "'");
}

// Sizes arrive as signed JSON so a negative value is reported instead of
// wrapping to a huge size_t.
size_t read_size(const nlohmann::json& config, const char* key, size_t fallback) {
    int64_t value = config.value(key, static_cast<int64_t>(fallback));
    if (value < 0) {
        throw InvalidConfig(std::string(key) + " must not be negative, got " + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

void check_timeout(std::chrono::milliseconds value, const char* key, bool allow_zero) {
    if (value.count() < 0 || (!allow_zero && value.count() == 0)) {
        throw InvalidConfig(std::string(key) + (allow_zero ? " must not be negative" : " must be positive"));
    }
    if (value > ProxyConfig::MAX_TIMEOUT) {
        throw InvalidConfig(std::string(key) + " must be at most " +
                            std::to_string(ProxyConfig::MAX_TIMEOUT.count()) + " ms");
    }
}

} // namespace

int ProxyConfig::default_worker_count() {
    unsigned int cpus = std::thread::hardware_concurrency();
    return cpus > 0 ? static_cast<int>(cpus) : 1;
}

std::vector<ResolverEndpoint> ProxyConfig::default_resolvers() {
    std::vector<ResolverEndpoint> resolvers;
    for (const char* entry : {"system", "1.1.1.1", "8.8.8.8", "9.9.9.9"}) {
        resolvers.push_back(ResolverEndpoint::parse(entry));
    }
    return resolvers;
}

ProxyConfig ProxyConfig::from_json(const nlohmann::json& config) {
    ProxyConfig result;
    try {
        if (config.contains("protocol")) {
            result.protocol = parse_protocol(config.at("protocol").get<std::string>());
        }
        result.bind_address = config.value("bind_address", result.bind_address);
        result.port = config.value("port", result.port);
        result.worker_count = config.value("worker_count", result.worker_count);

        if (config.contains("dns_resolvers")) {
            result.dns_resolvers.clear();
            for (const auto& entry : config.at("dns_resolvers").get<std::vector<std::string>>()) {
                result.dns_resolvers.push_back(ResolverEndpoint::parse(entry));
            }
        }
        result.dns_timeout = std::chrono::milliseconds(
            config.value("dns_timeout_ms", static_cast<int64_t>(result.dns_timeout.count())));
        result.dns_cache_max_ttl = std::chrono::seconds(
            config.value("dns_cache_max_ttl_s", static_cast<int64_t>(result.dns_cache_max_ttl.count())));
        result.dns_cache_max_entries = read_size(config, "dns_cache_max_entries", result.dns_cache_max_entries);
        result.connect_timeout = std::chrono::milliseconds(
            config.value("connect_timeout_ms", static_cast<int64_t>(result.connect_timeout.count())));
        result.handshake_timeout = std::chrono::milliseconds(
            config.value("handshake_timeout_ms", static_cast<int64_t>(result.handshake_timeout.count())));
        result.grace_period = std::chrono::milliseconds(
            config.value("grace_period_ms", static_cast<int64_t>(result.grace_period.count())));
        result.stats_interval = std::chrono::milliseconds(
            config.value("stats_interval_ms", static_cast<int64_t>(result.stats_interval.count())));

        result.outbound_address = config.value("outbound_address", result.outbound_address);
        result.outbound_interface = config.value("outbound_interface", result.outbound_interface);
        result.max_restarts = config.value("max_restarts", result.max_restarts);
        result.relay_buffer_size = read_size(config, "relay_buffer_size", result.relay_buffer_size);
        result.listen_backlog = config.value("listen_backlog", result.listen_backlog);
        result.log_level = config.value("log_level", result.log_level);
        result.log_file = config.value("log_file", result.log_file);
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfig(std::string("Malformed configuration: ") + e.what());
    }
    return result;
}

ProxyConfig ProxyConfig::from_file(const std::string& path) {
    std::ifstream config_file(path);
    if (!config_file) {
        throw InvalidConfig("Failed to open " + path);
    }
    nlohmann::json config;
    try {
        config_file >> config;
    } catch (const nlohmann::json::exception& e) {
        throw InvalidConfig("Failed to parse " + path + ": " + e.what());
    }
    return from_json(config);
}

void ProxyConfig::validate() const {
    if (!IpAddress::parse(bind_address)) {
        throw InvalidConfig("bind_address '" + bind_address + "' is not an IP address");
    }
    if (port < 0 || port > 65535) {
        throw InvalidConfig("port " + std::to_string(port) + " out of range");
    }
    if (worker_count <= 0) {
        throw InvalidConfig("worker_count must be positive, got " + std::to_string(worker_count));
    }
    if (dns_resolvers.empty()) {
        throw InvalidConfig("dns_resolvers must not be empty");
    }
    check_timeout(dns_timeout, "dns_timeout_ms", false);
    if (dns_cache_max_ttl.count() < 0) {
        throw InvalidConfig("dns_cache_max_ttl_s must not be negative");
    }
    check_timeout(connect_timeout, "connect_timeout_ms", false);
    check_timeout(handshake_timeout, "handshake_timeout_ms", true);
    check_timeout(grace_period, "grace_period_ms", true);
    check_timeout(stats_interval, "stats_interval_ms", false);
    if (!outbound_address.empty() && !IpAddress::parse(outbound_address)) {
        throw InvalidConfig("outbound_address '" + outbound_address + "' is not an IP address");
    }
    if (outbound_interface.size() >= IFNAMSIZ) {
        throw InvalidConfig("outbound_interface name too long: " + outbound_interface);
    }
    if (max_restarts < 0) {
        throw InvalidConfig("max_restarts must not be negative");
    }
    if (relay_buffer_size < 512 || relay_buffer_size > MAX_RELAY_BUFFER_SIZE) {
        throw InvalidConfig("relay_buffer_size must be between 512 and " +
                            std::to_string(MAX_RELAY_BUFFER_SIZE) + ", got " +
                            std::to_string(relay_buffer_size));
    }
    if (listen_backlog <= 0) {
        throw InvalidConfig("listen_backlog must be positive");
    }
}

void to_json(nlohmann::json& j, const ProxyConfig& config) {
    std::vector<std::string> resolvers;
    for (const auto& resolver : config.dns_resolvers) {
        resolvers.push_back(resolver.to_string());
    }
    j = nlohmann::json{
        {"protocol", proxy_protocol_name(config.protocol)},
        {"bind_address", config.bind_address},
        {"port", config.port},
        {"worker_count", config.worker_count},
        {"dns_resolvers", resolvers},
        {"dns_timeout_ms", config.dns_timeout.count()},
        {"dns_cache_max_ttl_s", config.dns_cache_max_ttl.count()},
        {"dns_cache_max_entries", config.dns_cache_max_entries},
        {"connect_timeout_ms", config.connect_timeout.count()},
        {"handshake_timeout_ms", config.handshake_timeout.count()},
        {"grace_period_ms", config.grace_period.count()},
        {"stats_interval_ms", config.stats_interval.count()},
        {"outbound_address", config.outbound_address},
        {"outbound_interface", config.outbound_interface},
        {"max_restarts", config.max_restarts},
        {"relay_buffer_size", config.relay_buffer_size},
        {"listen_backlog", config.listen_backlog},
        {"log_level", config.log_level},
        {"log_file", config.log_file},
    };
}
