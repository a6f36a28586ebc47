#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "Socks5Protocol.h"
#include "utils.h"

// HTTP/1.x forward proxy front end: CONNECT tunnels and plain-HTTP requests
// in absolute form ("GET http://host:port/path HTTP/1.1").

constexpr size_t MAX_HTTP_HEAD_SIZE = 16 * 1024;

struct HttpRequestHead {
    std::string method;
    std::string target;         // as sent on the request line
    std::string version;        // "HTTP/1.1"
    std::string host;           // upstream host, brackets stripped
    uint16_t port = 80;
    bool tunnel = false;        // CONNECT
    std::string forward;        // head to send upstream, empty for CONNECT
};

// Reads up to and including the blank line that ends the request head.
// Bytes the client sent past it are left in rest. Throws HttpError(431) when
// the head outgrows MAX_HTTP_HEAD_SIZE.
IoStatus read_http_head(int fd, std::string& head, std::string& rest);

// Parses the head and builds the upstream copy with an origin-form request
// line. Throws HttpError: 400 malformed, 501 unsupported scheme, 505 version.
HttpRequestHead parse_http_request(const std::string& head);

// "host", "host:port" or "[v6]:port". Throws HttpError(400).
void parse_authority(const std::string& authority, uint16_t default_port,
                     std::string& host, uint16_t& port);

const char* http_reason_phrase(int status);

// 200 opens a CONNECT tunnel; any other status has an empty body and
// closes the connection.
std::string encode_http_response(int status);

// Status answered to an HTTP client for a failed upstream step.
int http_status_for_reply(ReplyCode code);
