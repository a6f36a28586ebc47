#include "HttpProxy.h"

#include <algorithm>
#include <cctype>
#include <cerrno>

#include <sys/socket.h>

#include "Errors.h"

namespace {

// Offset just past the blank line ending the head, or npos. Bare LF line
// endings are accepted like CRLF.
size_t find_head_end(const std::string& data, size_t from) {
    size_t crlf = data.find("\r\n\r\n", from);
    size_t lf = data.find("\n\n", from);
    size_t end = std::string::npos;
    if (crlf != std::string::npos) {
        end = crlf + 4;
    }
    if (lf != std::string::npos && (end == std::string::npos || lf + 2 < end)) {
        end = lf + 2;
    }
    return end;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(begin, end - begin + 1);
}

uint16_t parse_port(const std::string& text, const std::string& authority) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw HttpError("Invalid port in '" + authority + "'", 400);
    }
    int port = std::stoi(text);
    if (port <= 0 || port > 65535) {
        throw HttpError("Port out of range in '" + authority + "'", 400);
    }
    return static_cast<uint16_t>(port);
}

std::string find_host_header(const std::string& head, size_t headers_begin) {
    size_t pos = headers_begin;
    while (pos < head.size()) {
        size_t eol = head.find('\n', pos);
        if (eol == std::string::npos) {
            eol = head.size();
        }
        std::string line = head.substr(pos, eol - pos);
        size_t colon = line.find(':');
        if (colon != std::string::npos && to_lower(trim(line.substr(0, colon))) == "host") {
            return trim(line.substr(colon + 1));
        }
        pos = eol + 1;
    }
    return "";
}

} // namespace

IoStatus read_http_head(int fd, std::string& head, std::string& rest) {
    std::string data;
    char buffer[4096];
    while (true) {
        ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
        if (n == 0) {
            return IoStatus::CLOSED;
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            return IoStatus::FAILED;
        }
        // the terminator may straddle two reads
        size_t search_from = data.size() >= 3 ? data.size() - 3 : 0;
        data.append(buffer, static_cast<size_t>(n));

        size_t end = find_head_end(data, search_from);
        if (end != std::string::npos && end <= MAX_HTTP_HEAD_SIZE) {
            head = data.substr(0, end);
            rest = data.substr(end);
            return IoStatus::OK;
        }
        if (data.size() > MAX_HTTP_HEAD_SIZE) {
            throw HttpError("Request head larger than " + std::to_string(MAX_HTTP_HEAD_SIZE) + " bytes", 431);
        }
    }
}

void parse_authority(const std::string& authority, uint16_t default_port,
                     std::string& host, uint16_t& port) {
    if (authority.empty()) {
        throw HttpError("Empty authority", 400);
    }
    port = default_port;
    if (authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos || close == 1) {
            throw HttpError("Malformed IPv6 authority '" + authority + "'", 400);
        }
        host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                throw HttpError("Malformed IPv6 authority '" + authority + "'", 400);
            }
            port = parse_port(tail.substr(1), authority);
        }
        return;
    }

    size_t colon = authority.find(':');
    if (colon == std::string::npos) {
        host = authority;
        return;
    }
    if (authority.find(':', colon + 1) != std::string::npos) {
        throw HttpError("IPv6 authority '" + authority + "' must be bracketed", 400);
    }
    host = authority.substr(0, colon);
    if (host.empty()) {
        throw HttpError("Empty host in '" + authority + "'", 400);
    }
    port = parse_port(authority.substr(colon + 1), authority);
}

HttpRequestHead parse_http_request(const std::string& head) {
    HttpRequestHead out;
    size_t line_end = head.find('\n');
    if (line_end == std::string::npos) {
        throw HttpError("Request line not terminated", 400);
    }
    std::string line = head.substr(0, line_end);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    size_t first_space = line.find(' ');
    size_t last_space = line.rfind(' ');
    if (first_space == std::string::npos || first_space == 0 || last_space == first_space) {
        throw HttpError("Malformed request line '" + line + "'", 400);
    }
    out.method = line.substr(0, first_space);
    out.target = trim(line.substr(first_space + 1, last_space - first_space - 1));
    out.version = line.substr(last_space + 1);
    if (out.target.empty()) {
        throw HttpError("Malformed request line '" + line + "'", 400);
    }
    if (out.version.compare(0, 7, "HTTP/1.") != 0) {
        if (out.version.compare(0, 5, "HTTP/") == 0) {
            throw HttpError("Unsupported HTTP version " + out.version, 505);
        }
        throw HttpError("Malformed request line '" + line + "'", 400);
    }

    if (out.method == "CONNECT") {
        out.tunnel = true;
        parse_authority(out.target, 443, out.host, out.port);
        return out;
    }

    std::string authority;
    std::string path;
    size_t scheme_end = out.target.find("://");
    if (scheme_end != std::string::npos) {
        std::string scheme = to_lower(out.target.substr(0, scheme_end));
        if (scheme != "http") {
            throw HttpError("Scheme '" + scheme + "' is not proxied, use CONNECT", 501);
        }
        size_t path_begin = out.target.find_first_of("/?", scheme_end + 3);
        if (path_begin == std::string::npos) {
            authority = out.target.substr(scheme_end + 3);
            path = "/";
        } else {
            authority = out.target.substr(scheme_end + 3, path_begin - scheme_end - 3);
            path = out.target.substr(path_begin);
            if (path.front() == '?') {
                path.insert(0, "/");
            }
        }
    } else if (out.target.front() == '/') {
        authority = find_host_header(head, line_end + 1);
        if (authority.empty()) {
            throw HttpError("Origin-form request without a Host header", 400);
        }
        path = out.target;
    } else {
        throw HttpError("Unsupported request target '" + out.target + "'", 400);
    }

    parse_authority(authority, 80, out.host, out.port);
    out.forward = out.method + " " + path + " " + out.version + "\r\n" + head.substr(line_end + 1);
    return out;
}

const char* http_reason_phrase(int status) {
    switch (status) {
        case 200: return "Connection established";
        case 400: return "Bad Request";
        case 431: return "Request Header Fields Too Large";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 504: return "Gateway Timeout";
        case 505: return "HTTP Version Not Supported";
        default: return "Error";
    }
}

std::string encode_http_response(int status) {
    std::string response = "HTTP/1.1 " + std::to_string(status) + " " + http_reason_phrase(status) + "\r\n";
    if (status != 200) {
        response += "Content-Length: 0\r\nConnection: close\r\n";
    }
    return response + "\r\n";
}

int http_status_for_reply(ReplyCode code) {
    switch (code) {
        case ReplyCode::SUCCEEDED: return 200;
        case ReplyCode::TTL_EXPIRED: return 504;
        case ReplyCode::COMMAND_NOT_SUPPORTED: return 501;
        case ReplyCode::ADDRESS_TYPE_NOT_SUPPORTED: return 400;
        default: return 502;
    }
}
