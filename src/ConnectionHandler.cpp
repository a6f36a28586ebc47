#include "ConnectionHandler.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <vector>

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "Errors.h"
#include "HttpProxy.h"

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::AWAITING_GREETING: return "awaiting-greeting";
        case SessionState::AWAITING_AUTH_SELECTION: return "awaiting-auth-selection";
        case SessionState::AWAITING_REQUEST: return "awaiting-request";
        case SessionState::RESOLVING: return "resolving";
        case SessionState::CONNECTING: return "connecting";
        case SessionState::RELAYING: return "relaying";
        case SessionState::CLOSED: return "closed";
        default: return "unknown";
    }
}

const char* exit_reason_name(ExitReason reason) {
    switch (reason) {
        case ExitReason::COMPLETED: return "completed";
        case ExitReason::CLIENT_DISCONNECTED: return "client disconnected";
        case ExitReason::PROTOCOL_ERROR: return "protocol error";
        case ExitReason::AUTH_REJECTED: return "no acceptable auth method";
        case ExitReason::COMMAND_REJECTED: return "command not supported";
        case ExitReason::DNS_FAILED: return "DNS resolution failed";
        case ExitReason::CONNECT_FAILED: return "upstream connect failed";
        case ExitReason::IO_ERROR: return "I/O error";
        case ExitReason::ABORTED: return "aborted";
        default: return "unknown";
    }
}

bool is_error_exit(ExitReason reason) {
    switch (reason) {
        case ExitReason::COMPLETED:
        case ExitReason::CLIENT_DISCONNECTED:
        case ExitReason::ABORTED:
            return false;
        default:
            return true;
    }
}

ReplyCode reply_for_connect_error(int err) {
    switch (err) {
        case ECONNREFUSED:
            return ReplyCode::CONNECTION_REFUSED;
        case ENETUNREACH:
        case ENETDOWN:
        case EAFNOSUPPORT:
            return ReplyCode::NETWORK_UNREACHABLE;
        case EHOSTUNREACH:
        case EHOSTDOWN:
        case ETIMEDOUT:
            return ReplyCode::HOST_UNREACHABLE;
        default:
            return ReplyCode::GENERAL_FAILURE;
    }
}

void ConnectionSession::advance(SessionState next) {
    SessionState current = state.load();
    if (next != SessionState::CLOSED && static_cast<int>(next) <= static_cast<int>(current)) {
        throw std::logic_error(std::string("Invalid session transition ") +
                               session_state_name(current) + " -> " + session_state_name(next));
    }
    if (current == SessionState::CLOSED) {
        throw std::logic_error("Session already closed");
    }
    state.store(next);
}

ConnectionHandler::ConnectionHandler(Socket client, const sockaddr_storage& client_addr,
                                     const ProxyConfig& config, Resolver& resolver,
                                     ProxyStats& stats, Logger& logger)
    : client_(std::move(client)), config_(config), resolver_(resolver), stats_(stats), logger_(logger) {
    session_.client_endpoint = endpoint_to_string(client_addr);
}

ExitReason ConnectionHandler::run() {
    ActiveConnectionGuard active(stats_);
    ExitReason reason = ExitReason::IO_ERROR;

    try {
        reason = config_.protocol == ProxyProtocol::HTTP ? serve_http() : serve();
    } catch (const HttpError& e) {
        logger_.log(LogLevel::WARNING, std::string("Bad HTTP request: ") + e.what(), session_.client_endpoint);
        send_http_error(e.status());
        reason = ExitReason::PROTOCOL_ERROR;
    } catch (const ProtocolError& e) {
        logger_.log(LogLevel::WARNING, std::string("Protocol error: ") + e.what(), session_.client_endpoint);
        if (e.has_reply()) {
            reply_and_close(e.reply());
        }
        reason = ExitReason::PROTOCOL_ERROR;
    } catch (const DnsResolutionFailed& e) {
        logger_.log(LogLevel::WARNING, e.what(), session_.client_endpoint);
        reply_and_close(ReplyCode::HOST_UNREACHABLE);
        reason = ExitReason::DNS_FAILED;
    } catch (const UpstreamConnectError& e) {
        logger_.log(LogLevel::WARNING,
                    "Failed to connect to " + session_.target_host + ":" + std::to_string(session_.target_port) +
                    ": " + e.what() + " (" + reply_code_name(e.reply()) + ")",
                    session_.client_endpoint);
        reply_and_close(e.reply());
        reason = ExitReason::CONNECT_FAILED;
    } catch (const std::exception& e) {
        logger_.log(LogLevel::ERROR, std::string("Error handling connection: ") + e.what(),
                    session_.client_endpoint);
        reason = ExitReason::IO_ERROR;
    }

    if (aborted_) {
        reason = ExitReason::ABORTED;
    }
    close_sockets();
    session_.state.store(SessionState::CLOSED);
    if (is_error_exit(reason)) {
        stats_.error();
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - session_.start_time);
    logger_.log(LogLevel::DEBUG,
                "Closing connection (" + std::string(exit_reason_name(reason)) + "), " +
                std::to_string(session_.bytes_sent.load()) + " bytes sent, " +
                std::to_string(session_.bytes_received.load()) + " bytes received in " +
                std::to_string(elapsed.count()) + " ms",
                session_.client_endpoint);
    return reason;
}

ExitReason ConnectionHandler::serve() {
    const int client_fd = client_.get();
    if (config_.handshake_timeout.count() > 0) {
        set_recv_timeout(client_fd, config_.handshake_timeout);
    }

    Greeting greeting;
    IoStatus status = read_greeting(client_fd, greeting);
    if (status != IoStatus::OK) {
        return handshake_io_exit(status, "greeting");
    }

    session_.advance(SessionState::AWAITING_AUTH_SELECTION);
    AuthMethod method = select_auth_method(greeting.methods);
    auto selection = encode_method_selection(method);
    if (!send_all(client_fd, selection.data(), selection.size())) {
        logger_.log(LogLevel::DEBUG, "Failed to send auth response", session_.client_endpoint);
        return ExitReason::IO_ERROR;
    }
    if (method == AuthMethod::NO_ACCEPTABLE) {
        logger_.log(LogLevel::WARNING, "No supported auth method offered", session_.client_endpoint);
        return ExitReason::AUTH_REJECTED;
    }

    session_.advance(SessionState::AWAITING_REQUEST);
    Request request;
    status = read_request(client_fd, request);
    if (status != IoStatus::OK) {
        return handshake_io_exit(status, "request");
    }
    session_.target_host = request.host;
    session_.target_port = request.port;

    if (request.command != static_cast<uint8_t>(Command::CONNECT)) {
        logger_.log(LogLevel::WARNING, "Unsupported command " + std::to_string(request.command),
                    session_.client_endpoint);
        reply_and_close(ReplyCode::COMMAND_NOT_SUPPORTED);
        return ExitReason::COMMAND_REJECTED;
    }

    session_.advance(SessionState::RESOLVING);
    IpAddress target = resolver_.resolve(request.host);

    session_.advance(SessionState::CONNECTING);
    connect_upstream(target, request.port);

    sockaddr_storage local_addr{};
    socklen_t addr_len = sizeof(local_addr);
    if (getsockname(upstream_.get(), reinterpret_cast<sockaddr*>(&local_addr), &addr_len) < 0) {
        throw UpstreamConnectError("getsockname failed: " + errno_string(errno), ReplyCode::GENERAL_FAILURE);
    }
    auto reply = encode_reply(ReplyCode::SUCCEEDED, &local_addr);
    if (!send_all(client_fd, reply.data(), reply.size())) {
        logger_.log(LogLevel::DEBUG, "Failed to send success reply", session_.client_endpoint);
        return ExitReason::IO_ERROR;
    }
    logger_.log(LogLevel::INFO,
                "Connected to " + request.host + ":" + std::to_string(request.port) +
                (request.address_type == AddressType::DOMAIN ? " (" + target.to_string() + ")" : "") +
                " via " + endpoint_to_string(local_addr),
                session_.client_endpoint);

    // relay reads wait for the peers, not for a clock
    set_recv_timeout(client_fd, std::chrono::milliseconds(0));
    session_.advance(SessionState::RELAYING);
    return relay() ? ExitReason::COMPLETED : ExitReason::IO_ERROR;
}

ExitReason ConnectionHandler::serve_http() {
    const int client_fd = client_.get();
    if (config_.handshake_timeout.count() > 0) {
        set_recv_timeout(client_fd, config_.handshake_timeout);
    }

    session_.advance(SessionState::AWAITING_REQUEST);
    std::string head;
    std::string rest;
    IoStatus status = read_http_head(client_fd, head, rest);
    if (status != IoStatus::OK) {
        return handshake_io_exit(status, "HTTP request");
    }
    HttpRequestHead request = parse_http_request(head);
    session_.target_host = request.host;
    session_.target_port = request.port;

    session_.advance(SessionState::RESOLVING);
    IpAddress target = resolver_.resolve(request.host);

    session_.advance(SessionState::CONNECTING);
    connect_upstream(target, request.port);

    if (request.tunnel) {
        std::string established = encode_http_response(200);
        if (!send_all(client_fd, established.data(), established.size())) {
            logger_.log(LogLevel::DEBUG, "Failed to send CONNECT response", session_.client_endpoint);
            return ExitReason::IO_ERROR;
        }
    }
    // the rewritten head plus anything pipelined behind it
    const std::string upstream_prefix = request.tunnel ? rest : request.forward + rest;
    if (!upstream_prefix.empty()) {
        if (!send_all(upstream_.get(), upstream_prefix.data(), upstream_prefix.size())) {
            logger_.log(LogLevel::DEBUG, "Failed to forward request head: " + errno_string(errno),
                        session_.client_endpoint);
            return ExitReason::IO_ERROR;
        }
        session_.bytes_sent += upstream_prefix.size();
        stats_.add_bytes_sent(upstream_prefix.size());
    }
    logger_.log(LogLevel::INFO,
                request.method + " " + request.host + ":" + std::to_string(request.port) +
                (IpAddress::parse(request.host) ? "" : " (" + target.to_string() + ")"),
                session_.client_endpoint);

    set_recv_timeout(client_fd, std::chrono::milliseconds(0));
    session_.advance(SessionState::RELAYING);
    return relay() ? ExitReason::COMPLETED : ExitReason::IO_ERROR;
}

ExitReason ConnectionHandler::handshake_io_exit(IoStatus status, const char* stage) {
    if (status == IoStatus::CLOSED) {
        logger_.log(LogLevel::DEBUG, std::string("Client disconnected during ") + stage,
                    session_.client_endpoint);
        return ExitReason::CLIENT_DISCONNECTED;
    }
    logger_.log(LogLevel::WARNING,
                std::string("Failed to read ") + stage + ": " + errno_string(errno),
                session_.client_endpoint);
    return ExitReason::IO_ERROR;
}

void ConnectionHandler::connect_upstream(const IpAddress& target, uint16_t port) {
    Socket sock(socket(target.family(), SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock.valid()) {
        int err = errno;
        throw UpstreamConnectError("socket creation failed: " + errno_string(err), reply_for_connect_error(err));
    }

    std::string bind_error;
    if (!bind_outbound(sock.get(), target.family(), config_.outbound_address,
                       config_.outbound_interface, bind_error)) {
        int err = errno;
        throw UpstreamConnectError(bind_error, reply_for_connect_error(err));
    }

    // Set socket to non-blocking for timeout control
    if (!set_non_blocking(sock.get(), true)) {
        throw UpstreamConnectError("fcntl failed: " + errno_string(errno), ReplyCode::GENERAL_FAILURE);
    }

    sockaddr_storage target_addr{};
    socklen_t target_len = target.to_sockaddr(port, target_addr);
    int result = connect(sock.get(), reinterpret_cast<sockaddr*>(&target_addr), target_len);
    if (result < 0 && errno != EINPROGRESS) {
        int err = errno;
        throw UpstreamConnectError(errno_string(err), reply_for_connect_error(err));
    }

    // Wait for connection to complete
    if (result < 0) {
        const auto deadline = std::chrono::steady_clock::now() + config_.connect_timeout;
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                throw UpstreamConnectError("connect timed out after " +
                                           std::to_string(config_.connect_timeout.count()) + " ms",
                                           ReplyCode::HOST_UNREACHABLE);
            }
            pollfd pfd{sock.get(), POLLOUT, 0};
            int ready = poll(&pfd, 1, poll_timeout_ms(remaining));
            if (ready < 0) {
                if (errno == EINTR) continue;
                int err = errno;
                throw UpstreamConnectError("poll failed: " + errno_string(err), ReplyCode::GENERAL_FAILURE);
            }
            if (ready > 0) break;
        }

        int error = 0;
        socklen_t len = sizeof(error);
        if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &error, &len) < 0) {
            error = errno;
        }
        if (error != 0) {
            throw UpstreamConnectError(errno_string(error), reply_for_connect_error(error));
        }
    }

    // Reset to blocking mode
    if (!set_non_blocking(sock.get(), false)) {
        throw UpstreamConnectError("fcntl failed: " + errno_string(errno), ReplyCode::GENERAL_FAILURE);
    }

    std::lock_guard<std::mutex> lock(sockets_mutex_);
    if (aborted_) {
        throw UpstreamConnectError("connection aborted", ReplyCode::GENERAL_FAILURE);
    }
    upstream_ = std::move(sock);
}

bool ConnectionHandler::relay() {
    std::atomic<bool> failed{false};
    const int client_fd = client_.get();
    const int upstream_fd = upstream_.get();

    // both buffers exist before the second thread does
    std::vector<char> upstream_buffer(config_.relay_buffer_size);
    std::vector<char> downstream_buffer(config_.relay_buffer_size);

    std::thread downstream([this, upstream_fd, client_fd, &downstream_buffer, &failed]() {
        try {
            pump(upstream_fd, client_fd, false, downstream_buffer, failed);
        } catch (const std::exception& e) {
            failed = true;
            shutdown(upstream_fd, SHUT_RDWR);
            shutdown(client_fd, SHUT_RDWR);
            logger_.log(LogLevel::ERROR, std::string("Relay from upstream failed: ") + e.what(),
                        session_.client_endpoint);
        }
    });
    try {
        pump(client_fd, upstream_fd, true, upstream_buffer, failed);
    } catch (...) {
        shutdown(upstream_fd, SHUT_RDWR);
        shutdown(client_fd, SHUT_RDWR);
        downstream.join();
        throw;
    }
    downstream.join();
    return !failed;
}

void ConnectionHandler::pump(int from, int to, bool client_to_upstream, std::vector<char>& buffer,
                             std::atomic<bool>& failed) {
    while (true) {
        ssize_t bytes = recv(from, buffer.data(), buffer.size(), 0);
        if (bytes == 0) {
            // pass the half-close on; the other direction keeps flowing
            shutdown(to, SHUT_WR);
            return;
        }
        if (bytes < 0) {
            if (errno == EINTR) continue;
            logger_.log(LogLevel::DEBUG,
                        std::string("Relay read from ") + (client_to_upstream ? "client" : "upstream") +
                        " failed: " + errno_string(errno),
                        session_.client_endpoint);
            break;
        }
        if (!send_all(to, buffer.data(), static_cast<size_t>(bytes))) {
            logger_.log(LogLevel::DEBUG,
                        std::string("Relay write to ") + (client_to_upstream ? "upstream" : "client") +
                        " failed: " + errno_string(errno),
                        session_.client_endpoint);
            break;
        }
        if (client_to_upstream) {
            session_.bytes_sent += static_cast<uint64_t>(bytes);
            stats_.add_bytes_sent(static_cast<uint64_t>(bytes));
        } else {
            session_.bytes_received += static_cast<uint64_t>(bytes);
            stats_.add_bytes_received(static_cast<uint64_t>(bytes));
        }
    }

    failed = true;
    // wakes the opposite direction so neither socket stays half-open
    shutdown(from, SHUT_RDWR);
    shutdown(to, SHUT_RDWR);
}

void ConnectionHandler::reply_and_close(ReplyCode code) {
    if (config_.protocol == ProxyProtocol::HTTP) {
        send_http_error(http_status_for_reply(code));
        return;
    }
    auto reply = encode_reply(code);
    send_and_linger(reply.data(), reply.size());
}

void ConnectionHandler::send_http_error(int status) {
    std::string response = encode_http_response(status);
    send_and_linger(response.data(), response.size());
}

void ConnectionHandler::send_and_linger(const void* data, size_t len) {
    const int client_fd = client_.get();
    if (!send_all(client_fd, data, len)) {
        return;
    }
    // Drain what the client already sent so close() does not turn into a
    // reset that destroys the reply in flight.
    shutdown(client_fd, SHUT_WR);
    char discard[512];
    while (recv(client_fd, discard, sizeof(discard), MSG_DONTWAIT) > 0) {
    }
}

void ConnectionHandler::abort() {
    std::lock_guard<std::mutex> lock(sockets_mutex_);
    aborted_ = true;
    if (client_.valid()) {
        shutdown(client_.get(), SHUT_RDWR);
    }
    if (upstream_.valid()) {
        shutdown(upstream_.get(), SHUT_RDWR);
    }
}

void ConnectionHandler::close_sockets() {
    std::lock_guard<std::mutex> lock(sockets_mutex_);
    upstream_.reset();
    client_.reset();
}
