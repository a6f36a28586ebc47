#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include <sys/socket.h>

#include "utils.h"

// RFC 1928 subset: no-auth method selection, CONNECT, IPv4/domain/IPv6 targets.

constexpr uint8_t SOCKS_VERSION = 0x05;

enum class AuthMethod : uint8_t {
    NO_AUTH = 0x00,
    GSSAPI = 0x01,
    USERNAME_PASSWORD = 0x02,
    NO_ACCEPTABLE = 0xFF
};

enum class Command : uint8_t {
    CONNECT = 0x01,
    BIND = 0x02,
    UDP_ASSOCIATE = 0x03
};

enum class AddressType : uint8_t {
    IPV4 = 0x01,
    DOMAIN = 0x03,
    IPV6 = 0x04
};

enum class ReplyCode : uint8_t {
    SUCCEEDED = 0x00,
    GENERAL_FAILURE = 0x01,
    NOT_ALLOWED = 0x02,
    NETWORK_UNREACHABLE = 0x03,
    HOST_UNREACHABLE = 0x04,
    CONNECTION_REFUSED = 0x05,
    TTL_EXPIRED = 0x06,
    COMMAND_NOT_SUPPORTED = 0x07,
    ADDRESS_TYPE_NOT_SUPPORTED = 0x08
};

const char* reply_code_name(ReplyCode code);

struct Greeting {
    uint8_t version = 0;
    std::vector<uint8_t> methods;
};

struct Request {
    uint8_t version = 0;
    uint8_t command = 0;
    uint8_t reserved = 0;
    AddressType address_type = AddressType::IPV4;
    std::string host;       // textual IP for IPV4/IPV6, the name for DOMAIN
    uint16_t port = 0;
};

/*
+-----+----------+----------+
| VER | NMETHODS | METHODS  |
+-----+----------+----------+
|  1  |    1     | 1 to 255 |
+-----+----------+----------+
A version other than 5 throws ProtocolError without a reply code.
*/
IoStatus read_greeting(int fd, Greeting& out);

/*
+-----+-----+-------+------+----------+----------+
| VER | CMD |  RSV  | ATYP | DST.ADDR | DST.PORT |
+-----+-----+-------+------+----------+----------+
|  1  |  1  | X'00' |  1   | Variable |    2     |
+-----+-----+-------+------+----------+----------+
RSV is accepted with any value. A bad VER or ATYP throws ProtocolError.
The address is read for every command so the reply can follow it.
*/
IoStatus read_request(int fd, Request& out);

AuthMethod select_auth_method(const std::vector<uint8_t>& methods);

std::vector<uint8_t> encode_method_selection(AuthMethod method);

// BND.ADDR/BND.PORT come from bound when given, otherwise 0.0.0.0:0.
std::vector<uint8_t> encode_reply(ReplyCode rep, const sockaddr_storage* bound = nullptr);
