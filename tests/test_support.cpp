#include "test_support.h"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace test {

namespace {

sockaddr_in loopback(uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    return addr;
}

uint16_t bound_port(int fd) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        throw std::runtime_error("getsockname: " + errno_string(errno));
    }
    return endpoint_port(addr);
}

uint16_t unused_port(int type) {
    Socket sock(socket(AF_INET, type, 0));
    sockaddr_in addr = loopback(0);
    if (!sock.valid() || bind(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw std::runtime_error("cannot reserve a port: " + errno_string(errno));
    }
    return bound_port(sock.get());
}

} // namespace

EchoServer::EchoServer(int family) {
    listener_ = make_listener(port_, family);
    acceptor_ = std::thread(&EchoServer::accept_loop, this);
}

EchoServer::~EchoServer() {
    stopping_ = true;
    acceptor_.join();
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& session : sessions_) {
        session.join();
    }
}

void EchoServer::accept_loop() {
    while (!stopping_) {
        pollfd pfd{listener_.get(), POLLIN, 0};
        if (poll(&pfd, 1, 50) <= 0) {
            continue;
        }
        int fd = accept(listener_.get(), nullptr, nullptr);
        if (fd < 0) {
            continue;
        }
        accepted_++;
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.emplace_back([fd]() {
            Socket conn(fd);
            set_recv_timeout(conn.get(), std::chrono::seconds(20));
            char buffer[8192];
            while (true) {
                ssize_t n = recv(conn.get(), buffer, sizeof(buffer), 0);
                if (n <= 0) {
                    break;
                }
                if (!send_all(conn.get(), buffer, static_cast<size_t>(n))) {
                    break;
                }
            }
            shutdown(conn.get(), SHUT_RDWR);
        });
    }
}

MockDnsServer::MockDnsServer(DnsRecords records, uint32_t ttl, bool silent)
    : records_(std::move(records)), ttl_(ttl), silent_(silent) {
    sock_.reset(socket(AF_INET, SOCK_DGRAM, 0));
    sockaddr_in addr = loopback(0);
    if (!sock_.valid() || bind(sock_.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw std::runtime_error("mock DNS bind failed: " + errno_string(errno));
    }
    port_ = bound_port(sock_.get());
    thread_ = std::thread(&MockDnsServer::serve, this);
}

MockDnsServer::~MockDnsServer() {
    stopping_ = true;
    thread_.join();
}

void MockDnsServer::serve() {
    uint8_t buffer[512];
    while (!stopping_) {
        pollfd pfd{sock_.get(), POLLIN, 0};
        if (poll(&pfd, 1, 50) <= 0) {
            continue;
        }
        sockaddr_storage from{};
        socklen_t from_len = sizeof(from);
        ssize_t n = recvfrom(sock_.get(), buffer, sizeof(buffer), 0,
                             reinterpret_cast<sockaddr*>(&from), &from_len);
        if (n < 12) {
            continue;
        }
        queries_++;
        if (silent_) {
            continue;
        }
        std::vector<uint8_t> response = answer(buffer, static_cast<size_t>(n));
        if (!response.empty()) {
            sendto(sock_.get(), response.data(), response.size(), 0,
                   reinterpret_cast<sockaddr*>(&from), from_len);
        }
    }
}

std::vector<uint8_t> MockDnsServer::answer(const uint8_t* query, size_t len) const {
    std::string name;
    size_t pos = 12;
    while (pos < len && query[pos] != 0) {
        size_t label = query[pos++];
        if (pos + label > len) {
            return {};
        }
        if (!name.empty()) {
            name += '.';
        }
        for (size_t i = 0; i < label; ++i) {
            name += static_cast<char>(std::tolower(query[pos + i]));
        }
        pos += label;
    }
    size_t question_end = pos + 1 + 4;
    if (question_end > len) {
        return {};
    }

    auto record = records_.find(name);
    in_addr ip{};
    bool found = record != records_.end() && inet_pton(AF_INET, record->second.c_str(), &ip) == 1;

    std::vector<uint8_t> response = {
        query[0], query[1],
        0x81, static_cast<uint8_t>(found ? 0x80 : 0x83),
        0x00, 0x01,
        0x00, static_cast<uint8_t>(found ? 1 : 0),
        0x00, 0x00,
        0x00, 0x00,
    };
    response.insert(response.end(), query + 12, query + question_end);
    if (found) {
        const uint8_t* addr = reinterpret_cast<const uint8_t*>(&ip);
        std::vector<uint8_t> rr = {
            0xc0, 0x0c, 0x00, 0x01, 0x00, 0x01,
            static_cast<uint8_t>(ttl_ >> 24), static_cast<uint8_t>(ttl_ >> 16),
            static_cast<uint8_t>(ttl_ >> 8), static_cast<uint8_t>(ttl_),
            0x00, 0x04, addr[0], addr[1], addr[2], addr[3],
        };
        response.insert(response.end(), rr.begin(), rr.end());
    }
    return response;
}

uint16_t unused_tcp_port() {
    return unused_port(SOCK_STREAM);
}

uint16_t unused_udp_port() {
    return unused_port(SOCK_DGRAM);
}

Socket make_listener(uint16_t& port, int family) {
    Socket sock(socket(family, SOCK_STREAM, 0));
    sockaddr_storage addr{};
    socklen_t addr_len = IpAddress::parse(family == AF_INET6 ? "::1" : "127.0.0.1")->to_sockaddr(0, addr);
    if (!sock.valid() || bind(sock.get(), reinterpret_cast<sockaddr*>(&addr), addr_len) < 0 ||
        listen(sock.get(), 128) < 0) {
        throw std::runtime_error("listener setup failed: " + errno_string(errno));
    }
    port = bound_port(sock.get());
    return sock;
}

Socket connect_loopback(uint16_t port) {
    Socket sock(socket(AF_INET, SOCK_STREAM, 0));
    sockaddr_in addr = loopback(port);
    if (!sock.valid() || connect(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw std::runtime_error("connect to port " + std::to_string(port) + " failed: " + errno_string(errno));
    }
    set_recv_timeout(sock.get(), std::chrono::seconds(20));
    return sock;
}

std::vector<uint8_t> read_n(int fd, size_t n) {
    std::vector<uint8_t> data(n);
    size_t done = 0;
    while (done < n) {
        ssize_t got = recv(fd, data.data() + done, n - done, 0);
        if (got < 0 && errno == EINTR) continue;
        if (got <= 0) break;
        done += static_cast<size_t>(got);
    }
    data.resize(done);
    return data;
}

std::vector<uint8_t> read_until_eof(int fd) {
    std::vector<uint8_t> data;
    uint8_t buffer[8192];
    while (true) {
        ssize_t got = recv(fd, buffer, sizeof(buffer), 0);
        if (got < 0 && errno == EINTR) continue;
        if (got <= 0) break;
        data.insert(data.end(), buffer, buffer + got);
    }
    return data;
}

void write_bytes(int fd, const std::vector<uint8_t>& data) {
    if (!send_all(fd, data.data(), data.size())) {
        throw std::runtime_error("send failed: " + errno_string(errno));
    }
}

std::vector<uint8_t> socks_connect_ipv4(int fd, uint16_t port) {
    write_bytes(fd, {0x05, 0x01, 0x00});
    std::vector<uint8_t> method = read_n(fd, 2);
    if (method != std::vector<uint8_t>{0x05, 0x00}) {
        return method;
    }
    write_bytes(fd, {0x05, 0x01, 0x00, 0x01, 127, 0, 0, 1,
                     static_cast<uint8_t>(port >> 8), static_cast<uint8_t>(port & 0xff)});
    return read_n(fd, 10);
}

std::vector<uint8_t> socks_connect_domain(int fd, const std::string& host, uint16_t port) {
    write_bytes(fd, {0x05, 0x01, 0x00});
    std::vector<uint8_t> method = read_n(fd, 2);
    if (method != std::vector<uint8_t>{0x05, 0x00}) {
        return method;
    }
    std::vector<uint8_t> request = {0x05, 0x01, 0x00, 0x03, static_cast<uint8_t>(host.size())};
    request.insert(request.end(), host.begin(), host.end());
    request.push_back(static_cast<uint8_t>(port >> 8));
    request.push_back(static_cast<uint8_t>(port & 0xff));
    write_bytes(fd, request);
    return read_n(fd, 10);
}

std::vector<uint8_t> socks_connect_ipv6(int fd, uint16_t port) {
    write_bytes(fd, {0x05, 0x01, 0x00});
    std::vector<uint8_t> method = read_n(fd, 2);
    if (method != std::vector<uint8_t>{0x05, 0x00}) {
        return method;
    }
    std::vector<uint8_t> request = {0x05, 0x01, 0x00, 0x04};
    request.insert(request.end(), 15, 0x00);
    request.push_back(0x01);
    request.push_back(static_cast<uint8_t>(port >> 8));
    request.push_back(static_cast<uint8_t>(port & 0xff));
    write_bytes(fd, request);
    return read_n(fd, 22);
}

std::vector<uint8_t> pattern(size_t size, uint8_t seed) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + seed) & 0xff);
    }
    return data;
}

bool eventually(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return predicate();
}

} // namespace test
