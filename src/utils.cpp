#include "utils.h"

#include <arpa/inet.h>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <sys/time.h>
#include <unistd.h>

void Socket::reset(int fd) {
    if (fd_ >= 0) {
        close(fd_);
    }
    fd_ = fd;
}

std::optional<IpAddress> IpAddress::parse(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string host = text;
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }

    in_addr v4{};
    if (inet_pton(AF_INET, host.c_str(), &v4) == 1) {
        return from_v4(v4);
    }
    in6_addr v6{};
    if (inet_pton(AF_INET6, host.c_str(), &v6) == 1) {
        return from_v6(v6);
    }
    return std::nullopt;
}

IpAddress IpAddress::from_sockaddr(const sockaddr* sa) {
    if (sa->sa_family == AF_INET) {
        return from_v4(reinterpret_cast<const sockaddr_in*>(sa)->sin_addr);
    }
    if (sa->sa_family == AF_INET6) {
        return from_v6(reinterpret_cast<const sockaddr_in6*>(sa)->sin6_addr);
    }
    return IpAddress();
}

IpAddress IpAddress::from_v4(const in_addr& addr) {
    IpAddress ip;
    ip.family_ = AF_INET;
    memcpy(ip.bytes_.data(), &addr, sizeof(addr));
    return ip;
}

IpAddress IpAddress::from_v6(const in6_addr& addr) {
    IpAddress ip;
    ip.family_ = AF_INET6;
    memcpy(ip.bytes_.data(), &addr, sizeof(addr));
    return ip;
}

std::string IpAddress::to_string() const {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (family_ == AF_UNSPEC || !inet_ntop(family_, bytes_.data(), buf, sizeof(buf))) {
        return "";
    }
    return buf;
}

socklen_t IpAddress::to_sockaddr(uint16_t port, sockaddr_storage& out) const {
    memset(&out, 0, sizeof(out));
    if (family_ == AF_INET) {
        auto* sin = reinterpret_cast<sockaddr_in*>(&out);
        sin->sin_family = AF_INET;
        sin->sin_port = htons(port);
        memcpy(&sin->sin_addr, bytes_.data(), sizeof(sin->sin_addr));
        return sizeof(sockaddr_in);
    }
    if (family_ == AF_INET6) {
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(&out);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(port);
        memcpy(&sin6->sin6_addr, bytes_.data(), sizeof(sin6->sin6_addr));
        return sizeof(sockaddr_in6);
    }
    return 0;
}

IoStatus recv_exact(int fd, void* buffer, size_t len) {
    auto* out = static_cast<unsigned char*>(buffer);
    size_t done = 0;
    while (done < len) {
        ssize_t bytes = recv(fd, out + done, len - done, 0);
        if (bytes == 0) {
            return IoStatus::CLOSED;
        }
        if (bytes < 0) {
            if (errno == EINTR) continue;
            return IoStatus::FAILED;
        }
        done += static_cast<size_t>(bytes);
    }
    return IoStatus::OK;
}

bool send_all(int fd, const void* buffer, size_t len) {
    const auto* in = static_cast<const unsigned char*>(buffer);
    size_t done = 0;
    while (done < len) {
        ssize_t bytes = send(fd, in + done, len - done, MSG_NOSIGNAL);
        if (bytes < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        done += static_cast<size_t>(bytes);
    }
    return true;
}

bool set_non_blocking(int fd, bool enabled) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) return false;
    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) != -1;
}

int poll_timeout_ms(std::chrono::milliseconds remaining) {
    if (remaining.count() <= 0) {
        return 0;
    }
    if (remaining.count() > INT_MAX) {
        return INT_MAX;
    }
    return static_cast<int>(remaining.count());
}

bool set_recv_timeout(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

std::string endpoint_to_string(const sockaddr_storage& addr) {
    IpAddress ip = IpAddress::from_sockaddr(reinterpret_cast<const sockaddr*>(&addr));
    if (ip.empty()) {
        return "unknown";
    }
    if (ip.is_v6()) {
        return "[" + ip.to_string() + "]:" + std::to_string(endpoint_port(addr));
    }
    return ip.to_string() + ":" + std::to_string(endpoint_port(addr));
}

uint16_t endpoint_port(const sockaddr_storage& addr) {
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    }
    return 0;
}

std::string errno_string(int err) {
    return std::string(strerror(err));
}

bool bind_outbound(int fd, int family, const std::string& address,
                   const std::string& interface_name, std::string& error) {
    if (!interface_name.empty()) {
        if (setsockopt(fd, SOL_SOCKET, SO_BINDTODEVICE, interface_name.data(),
                       static_cast<socklen_t>(interface_name.size())) < 0) {
            int err = errno;
            error = "SO_BINDTODEVICE " + interface_name + " failed: " + errno_string(err);
            errno = err;
            return false;
        }
    }
    if (address.empty()) {
        return true;
    }

    auto local = IpAddress::parse(address);
    if (!local) {
        error = "invalid outbound address " + address;
        return false;
    }
    if (local->family() != family) {
        error = "outbound address " + address + " does not match the target address family";
        errno = EAFNOSUPPORT;
        return false;
    }
    sockaddr_storage local_addr{};
    socklen_t len = local->to_sockaddr(0, local_addr);
    if (bind(fd, reinterpret_cast<sockaddr*>(&local_addr), len) < 0) {
        int err = errno;
        error = "bind to " + address + " failed: " + errno_string(err);
        errno = err;
        return false;
    }
    return true;
}
