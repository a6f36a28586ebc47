#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <netinet/in.h>
#include <sys/socket.h>

// Owns a socket descriptor; closes it on destruction.
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() { reset(); }

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept : fd_(other.release()) {}
    Socket& operator=(Socket&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1);

private:
    int fd_ = -1;
};

class IpAddress {
public:
    IpAddress() = default;

    // Accepts dotted IPv4 or textual IPv6 (optionally in brackets).
    static std::optional<IpAddress> parse(const std::string& text);
    static IpAddress from_sockaddr(const sockaddr* sa);
    static IpAddress from_v4(const in_addr& addr);
    static IpAddress from_v6(const in6_addr& addr);

    int family() const { return family_; }
    bool is_v4() const { return family_ == AF_INET; }
    bool is_v6() const { return family_ == AF_INET6; }
    bool empty() const { return family_ == AF_UNSPEC; }

    std::string to_string() const;
    socklen_t to_sockaddr(uint16_t port, sockaddr_storage& out) const;

    bool operator==(const IpAddress& other) const {
        return family_ == other.family_ && bytes_ == other.bytes_;
    }
    bool operator!=(const IpAddress& other) const { return !(*this == other); }

private:
    int family_ = AF_UNSPEC;
    std::array<uint8_t, 16> bytes_{};
};

enum class IoStatus {
    OK,
    CLOSED,   // orderly shutdown by the peer
    FAILED    // socket error or receive timeout
};

// Reads exactly len bytes, retrying on partial reads and EINTR.
IoStatus recv_exact(int fd, void* buffer, size_t len);

// Writes the whole buffer. Never raises SIGPIPE.
bool send_all(int fd, const void* buffer, size_t len);

bool set_non_blocking(int fd, bool enabled);

// Remaining time as a poll() argument, clamped to [0, INT_MAX].
int poll_timeout_ms(std::chrono::milliseconds remaining);

// SO_RCVTIMEO; zero clears the timeout.
bool set_recv_timeout(int fd, std::chrono::milliseconds timeout);

std::string endpoint_to_string(const sockaddr_storage& addr);
uint16_t endpoint_port(const sockaddr_storage& addr);

std::string errno_string(int err);

// Pins a not-yet-connected socket to the egress address and/or interface.
// Either may be empty. On failure fills error and returns false.
bool bind_outbound(int fd, int family, const std::string& address,
                   const std::string& interface_name, std::string& error);
