#include "Resolver.h"

#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <thread>

#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <netdb.h>
#include <poll.h>
#include <resolv.h>
#include <sys/socket.h>
#include <unistd.h>

#include "Errors.h"

namespace {

// getaddrinfo has no timeout of its own, so it runs on a detached thread
// that owns this state jointly with the waiting caller.
struct SystemLookup {
    std::mutex mutex;
    std::condition_variable done_cv;
    bool done = false;
    int rc = 0;
    std::optional<IpAddress> address;
};

std::optional<IpAddress> first_address(const addrinfo* list) {
    std::optional<IpAddress> v6;
    for (const addrinfo* ai = list; ai; ai = ai->ai_next) {
        IpAddress ip = IpAddress::from_sockaddr(ai->ai_addr);
        if (ip.is_v4()) {
            return ip;
        }
        if (ip.is_v6() && !v6) {
            v6 = ip;
        }
    }
    return v6;
}

} // namespace

Resolver::Resolver(std::vector<ResolverEndpoint> endpoints, std::chrono::milliseconds timeout,
                   std::chrono::seconds cache_max_ttl, Logger& logger)
    : endpoints_(std::move(endpoints)), timeout_(timeout), cache_max_ttl_(cache_max_ttl),
      logger_(logger) {}

Resolver::Resolver(const ProxyConfig& config, Logger& logger)
    : Resolver(config.dns_resolvers, config.dns_timeout, config.dns_cache_max_ttl, logger) {
    set_outbound(config.outbound_address, config.outbound_interface);
    set_cache_limit(config.dns_cache_max_entries);
}

void Resolver::set_cache_limit(size_t max_entries) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_max_entries_ = max_entries;
    cache_make_room(std::chrono::steady_clock::now());
}

void Resolver::set_outbound(const std::string& address, const std::string& interface_name) {
    outbound_address_ = address;
    outbound_interface_ = interface_name;
}

IpAddress Resolver::resolve(const std::string& hostname) {
    if (auto literal = IpAddress::parse(hostname)) {
        return *literal;
    }
    if (auto cached = cache_lookup(hostname)) {
        logger_.log(LogLevel::DEBUG, "DNS cache hit for " + hostname + ": " + cached->to_string());
        return *cached;
    }

    for (const auto& endpoint : endpoints_) {
        std::optional<Answer> answer = endpoint.system
            ? query_system(hostname)
            : query_nameserver(endpoint, hostname);
        if (answer) {
            logger_.log(LogLevel::DEBUG, "Resolved " + hostname + " to " + answer->address.to_string() +
                        " via " + endpoint.to_string());
            cache_store(hostname, *answer);
            return answer->address;
        }
    }

    cache_invalidate(hostname);
    logger_.log(LogLevel::WARNING, "Could not resolve " + hostname + " using any configured resolver");
    throw DnsResolutionFailed(hostname);
}

std::optional<Resolver::Answer> Resolver::query_system(const std::string& hostname) {
    auto state = std::make_shared<SystemLookup>();
    std::thread([state, hostname]() {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* result = nullptr;
        int rc = getaddrinfo(hostname.c_str(), nullptr, &hints, &result);
        std::optional<IpAddress> address;
        if (rc == 0 && result) {
            address = first_address(result);
        }
        if (result) {
            freeaddrinfo(result);
        }
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->rc = rc;
            state->address = address;
            state->done = true;
        }
        state->done_cv.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lock(state->mutex);
    if (!state->done_cv.wait_for(lock, timeout_, [&state] { return state->done; })) {
        logger_.log(LogLevel::DEBUG, "System DNS timed out for " + hostname);
        return std::nullopt;
    }
    if (state->rc != 0 || !state->address) {
        logger_.log(LogLevel::DEBUG, "System DNS resolution failed for " + hostname + ": " +
                    (state->rc != 0 ? gai_strerror(state->rc) : "no address"));
        return std::nullopt;
    }
    // getaddrinfo does not expose record TTLs; such answers are never cached.
    return Answer{*state->address, std::nullopt};
}

std::optional<Resolver::Answer> Resolver::query_nameserver(const ResolverEndpoint& nameserver,
                                                           const std::string& hostname) {
    const std::string server_name = nameserver.to_string();

    struct __res_state res;
    memset(&res, 0, sizeof(res));
    if (res_ninit(&res) != 0) {
        logger_.log(LogLevel::ERROR, "res_ninit failed");
        return std::nullopt;
    }
    unsigned char query[NS_PACKETSZ];
    int query_len = res_nmkquery(&res, ns_o_query, hostname.c_str(), ns_c_in, ns_t_a,
                                 nullptr, 0, nullptr, query, sizeof(query));
    res_nclose(&res);
    if (query_len < 0) {
        logger_.log(LogLevel::DEBUG, "Cannot build DNS query for " + hostname);
        return std::nullopt;
    }

    Socket sock(socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (!sock.valid()) {
        logger_.log(LogLevel::ERROR, "DNS socket creation failed: " + errno_string(errno));
        return std::nullopt;
    }
    std::string bind_error;
    if (!bind_outbound(sock.get(), AF_INET, outbound_address_, outbound_interface_, bind_error)) {
        logger_.log(LogLevel::DEBUG, "Nameserver " + server_name + ": " + bind_error);
        return std::nullopt;
    }

    sockaddr_storage ns_addr{};
    socklen_t ns_len = nameserver.address.to_sockaddr(nameserver.port, ns_addr);
    // connected UDP so an ICMP port-unreachable fails the attempt right away
    if (connect(sock.get(), reinterpret_cast<sockaddr*>(&ns_addr), ns_len) < 0 ||
        !send_all(sock.get(), query, static_cast<size_t>(query_len))) {
        logger_.log(LogLevel::DEBUG, "Nameserver " + server_name + " unreachable: " + errno_string(errno));
        return std::nullopt;
    }

    const uint16_t query_id = static_cast<uint16_t>((query[0] << 8) | query[1]);
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    unsigned char answer[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            logger_.log(LogLevel::DEBUG, "Nameserver " + server_name + " timed out for " + hostname);
            return std::nullopt;
        }

        pollfd pfd{sock.get(), POLLIN, 0};
        int ready = poll(&pfd, 1, poll_timeout_ms(remaining));
        if (ready < 0) {
            if (errno == EINTR) continue;
            logger_.log(LogLevel::DEBUG, "poll on nameserver " + server_name + " failed: " + errno_string(errno));
            return std::nullopt;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t len = recv(sock.get(), answer, sizeof(answer), 0);
        if (len < 0) {
            if (errno == EINTR) continue;
            logger_.log(LogLevel::DEBUG, "Nameserver " + server_name + " failed: " + errno_string(errno));
            return std::nullopt;
        }
        if (len < 2 || static_cast<uint16_t>((answer[0] << 8) | answer[1]) != query_id) {
            // stray datagram, keep waiting for ours
            continue;
        }

        ns_msg msg;
        if (ns_initparse(answer, static_cast<int>(len), &msg) < 0) {
            logger_.log(LogLevel::DEBUG, "Malformed response from nameserver " + server_name);
            return std::nullopt;
        }
        if (!ns_msg_getflag(msg, ns_f_qr) || ns_msg_getflag(msg, ns_f_rcode) != ns_r_noerror) {
            logger_.log(LogLevel::DEBUG, "Nameserver " + server_name + " answered rcode " +
                        std::to_string(ns_msg_getflag(msg, ns_f_rcode)) + " for " + hostname);
            return std::nullopt;
        }

        int count = ns_msg_count(msg, ns_s_an);
        for (int i = 0; i < count; ++i) {
            ns_rr rr;
            if (ns_parserr(&msg, ns_s_an, i, &rr) < 0) {
                break;
            }
            if (ns_rr_type(rr) == ns_t_a && ns_rr_class(rr) == ns_c_in && ns_rr_rdlen(rr) == 4) {
                in_addr addr{};
                memcpy(&addr, ns_rr_rdata(rr), sizeof(addr));
                return Answer{IpAddress::from_v4(addr), std::chrono::seconds(ns_rr_ttl(rr))};
            }
        }
        logger_.log(LogLevel::DEBUG, "Nameserver " + server_name + " returned no A record for " + hostname);
        return std::nullopt;
    }
}

std::optional<IpAddress> Resolver::cache_lookup(const std::string& hostname) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_.find(hostname);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    if (std::chrono::steady_clock::now() >= it->second.expires) {
        cache_.erase(it);
        return std::nullopt;
    }
    return it->second.address;
}

void Resolver::cache_store(const std::string& hostname, const Answer& answer) {
    if (!answer.ttl) {
        return;
    }
    auto ttl = std::min(*answer.ttl, cache_max_ttl_);
    if (ttl.count() <= 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (cache_max_entries_ == 0) {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    if (cache_.find(hostname) == cache_.end()) {
        cache_make_room(now);
    }
    cache_[hostname] = CacheEntry{answer.address, now + ttl};
}

// Called with cache_mutex_ held. Leaves space for one more entry: expired
// entries go first, then the ones closest to expiry.
void Resolver::cache_make_room(std::chrono::steady_clock::time_point now) {
    if (cache_.size() < cache_max_entries_) {
        return;
    }
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (now >= it->second.expires) {
            it = cache_.erase(it);
        } else {
            ++it;
        }
    }
    while (!cache_.empty() && cache_.size() >= cache_max_entries_) {
        auto soonest = std::min_element(cache_.begin(), cache_.end(),
                                        [](const auto& a, const auto& b) {
                                            return a.second.expires < b.second.expires;
                                        });
        cache_.erase(soonest);
    }
}

void Resolver::cache_invalidate(const std::string& hostname) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.erase(hostname);
}

size_t Resolver::cache_size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

void Resolver::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
}
