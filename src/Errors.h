#pragma once
#include <stdexcept>
#include <string>

#include "Socks5Protocol.h"

class ProxyError : public std::runtime_error {
public:
    explicit ProxyError(const std::string& message) : std::runtime_error(message) {}
};

// Listener could not be created. Fatal, startup only.
class BindError : public ProxyError {
public:
    BindError(const std::string& message, int err)
        : ProxyError(message), error_code_(err) {}

    int error_code() const { return error_code_; }

private:
    int error_code_;
};

// Rejected configuration. Fatal, startup only.
class InvalidConfig : public ProxyError {
public:
    explicit InvalidConfig(const std::string& message) : ProxyError(message) {}
};

class DnsResolutionFailed : public ProxyError {
public:
    explicit DnsResolutionFailed(const std::string& hostname)
        : ProxyError("DNS resolution failed for " + hostname), hostname_(hostname) {}

    const std::string& hostname() const { return hostname_; }

private:
    std::string hostname_;
};

class UpstreamConnectError : public ProxyError {
public:
    UpstreamConnectError(const std::string& message, ReplyCode reply)
        : ProxyError(message), reply_(reply) {}

    ReplyCode reply() const { return reply_; }

private:
    ReplyCode reply_;
};

// Malformed client input. has_reply() is false before method negotiation
// completes, where the connection is closed without an answer.
class ProtocolError : public ProxyError {
public:
    explicit ProtocolError(const std::string& message)
        : ProxyError(message), has_reply_(false), reply_(ReplyCode::GENERAL_FAILURE) {}
    ProtocolError(const std::string& message, ReplyCode reply)
        : ProxyError(message), has_reply_(true), reply_(reply) {}

    bool has_reply() const { return has_reply_; }
    ReplyCode reply() const { return reply_; }

private:
    bool has_reply_;
    ReplyCode reply_;
};

// Malformed or unsupported HTTP proxy request, answered with status.
class HttpError : public ProxyError {
public:
    HttpError(const std::string& message, int status) : ProxyError(message), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};
