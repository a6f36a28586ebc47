#include "Socks5Protocol.h"

#include <arpa/inet.h>
#include <cstring>

#include "Errors.h"

const char* reply_code_name(ReplyCode code) {
    switch (code) {
        case ReplyCode::SUCCEEDED: return "succeeded";
        case ReplyCode::GENERAL_FAILURE: return "general failure";
        case ReplyCode::NOT_ALLOWED: return "connection not allowed";
        case ReplyCode::NETWORK_UNREACHABLE: return "network unreachable";
        case ReplyCode::HOST_UNREACHABLE: return "host unreachable";
        case ReplyCode::CONNECTION_REFUSED: return "connection refused";
        case ReplyCode::TTL_EXPIRED: return "TTL expired";
        case ReplyCode::COMMAND_NOT_SUPPORTED: return "command not supported";
        case ReplyCode::ADDRESS_TYPE_NOT_SUPPORTED: return "address type not supported";
        default: return "unknown";
    }
}

IoStatus read_greeting(int fd, Greeting& out) {
    unsigned char buffer[256];
    IoStatus status = recv_exact(fd, buffer, 2);
    if (status != IoStatus::OK) {
        return status;
    }
    out.version = buffer[0];
    if (out.version != SOCKS_VERSION) {
        throw ProtocolError("Unsupported SOCKS version " + std::to_string(out.version));
    }

    uint8_t nmethods = buffer[1];
    out.methods.clear();
    if (nmethods == 0) {
        return IoStatus::OK;
    }
    status = recv_exact(fd, buffer, nmethods);
    if (status != IoStatus::OK) {
        return status;
    }
    out.methods.assign(buffer, buffer + nmethods);
    return IoStatus::OK;
}

IoStatus read_request(int fd, Request& out) {
    unsigned char buffer[258];
    IoStatus status = recv_exact(fd, buffer, 4);
    if (status != IoStatus::OK) {
        return status;
    }

    out.version = buffer[0];
    out.command = buffer[1];
    out.reserved = buffer[2];
    uint8_t atype = buffer[3];

    if (out.version != SOCKS_VERSION) {
        throw ProtocolError("Invalid SOCKS version in request: " + std::to_string(out.version),
                            ReplyCode::GENERAL_FAILURE);
    }

    switch (atype) {
        case static_cast<uint8_t>(AddressType::IPV4): {
            status = recv_exact(fd, buffer, 6);
            if (status != IoStatus::OK) return status;
            char ip[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, buffer, ip, sizeof(ip));
            out.address_type = AddressType::IPV4;
            out.host = ip;
            out.port = static_cast<uint16_t>((buffer[4] << 8) | buffer[5]);
            break;
        }
        case static_cast<uint8_t>(AddressType::DOMAIN): {
            status = recv_exact(fd, buffer, 1);
            if (status != IoStatus::OK) return status;
            uint8_t domain_len = buffer[0];
            status = recv_exact(fd, buffer, static_cast<size_t>(domain_len) + 2);
            if (status != IoStatus::OK) return status;
            if (domain_len == 0) {
                throw ProtocolError("Empty domain name", ReplyCode::GENERAL_FAILURE);
            }
            out.address_type = AddressType::DOMAIN;
            out.host = std::string(reinterpret_cast<char*>(buffer), domain_len);
            out.port = static_cast<uint16_t>((buffer[domain_len] << 8) | buffer[domain_len + 1]);
            break;
        }
        case static_cast<uint8_t>(AddressType::IPV6): {
            status = recv_exact(fd, buffer, 18);
            if (status != IoStatus::OK) return status;
            char ip[INET6_ADDRSTRLEN];
            inet_ntop(AF_INET6, buffer, ip, sizeof(ip));
            out.address_type = AddressType::IPV6;
            out.host = ip;
            out.port = static_cast<uint16_t>((buffer[16] << 8) | buffer[17]);
            break;
        }
        default:
            throw ProtocolError("Address type not supported: " + std::to_string(atype),
                                ReplyCode::ADDRESS_TYPE_NOT_SUPPORTED);
    }
    return IoStatus::OK;
}

AuthMethod select_auth_method(const std::vector<uint8_t>& methods) {
    for (uint8_t method : methods) {
        if (method == static_cast<uint8_t>(AuthMethod::NO_AUTH)) {
            return AuthMethod::NO_AUTH;
        }
    }
    return AuthMethod::NO_ACCEPTABLE;
}

std::vector<uint8_t> encode_method_selection(AuthMethod method) {
    return {SOCKS_VERSION, static_cast<uint8_t>(method)};
}

std::vector<uint8_t> encode_reply(ReplyCode rep, const sockaddr_storage* bound) {
    std::vector<uint8_t> response = {SOCKS_VERSION, static_cast<uint8_t>(rep), 0x00};

    if (bound && bound->ss_family == AF_INET6) {
        const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(bound);
        response.push_back(static_cast<uint8_t>(AddressType::IPV6));
        const auto* addr = reinterpret_cast<const uint8_t*>(&sin6->sin6_addr);
        response.insert(response.end(), addr, addr + 16);
        const auto* port = reinterpret_cast<const uint8_t*>(&sin6->sin6_port);
        response.insert(response.end(), port, port + 2);
        return response;
    }

    response.push_back(static_cast<uint8_t>(AddressType::IPV4));
    if (bound && bound->ss_family == AF_INET) {
        const auto* sin = reinterpret_cast<const sockaddr_in*>(bound);
        const auto* addr = reinterpret_cast<const uint8_t*>(&sin->sin_addr);
        response.insert(response.end(), addr, addr + 4);
        const auto* port = reinterpret_cast<const uint8_t*>(&sin->sin_port);
        response.insert(response.end(), port, port + 2);
    } else {
        response.insert(response.end(), size_t{6}, uint8_t{0});
    }
    return response;
}
