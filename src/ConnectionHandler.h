#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "Logger.h"
#include "ProxyConfig.h"
#include "ProxyStats.h"
#include "Resolver.h"
#include "Socks5Protocol.h"
#include "utils.h"

enum class SessionState {
    AWAITING_GREETING,
    AWAITING_AUTH_SELECTION,
    AWAITING_REQUEST,
    RESOLVING,
    CONNECTING,
    RELAYING,
    CLOSED
};

const char* session_state_name(SessionState state);

enum class ExitReason {
    COMPLETED,
    CLIENT_DISCONNECTED,    // peer vanished during the handshake
    PROTOCOL_ERROR,
    AUTH_REJECTED,
    COMMAND_REJECTED,
    DNS_FAILED,
    CONNECT_FAILED,
    IO_ERROR,
    ABORTED                 // force-closed by the worker
};

const char* exit_reason_name(ExitReason reason);

// Exits that count towards total_errors.
bool is_error_exit(ExitReason reason);

// Closest SOCKS5 reply for an errno from socket()/bind()/connect().
ReplyCode reply_for_connect_error(int err);

struct ConnectionSession {
    std::string client_endpoint;
    std::string target_host;
    uint16_t target_port = 0;
    std::atomic<SessionState> state{SessionState::AWAITING_GREETING};
    std::atomic<uint64_t> bytes_sent{0};       // client -> upstream
    std::atomic<uint64_t> bytes_received{0};   // upstream -> client
    std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();

    // States only move forward. CLOSED is reachable from anywhere.
    // Throws std::logic_error on a backward or repeated transition.
    void advance(SessionState next);
};

// Services one accepted client connection from greeting to close, speaking
// SOCKS5 or HTTP proxy requests as configured.
class ConnectionHandler {
public:
    ConnectionHandler(Socket client, const sockaddr_storage& client_addr, const ProxyConfig& config,
                      Resolver& resolver, ProxyStats& stats, Logger& logger);

    ConnectionHandler(const ConnectionHandler&) = delete;
    ConnectionHandler& operator=(const ConnectionHandler&) = delete;

    // Runs the whole session on the calling thread. Never throws. Both
    // sockets are closed when it returns.
    ExitReason run();

    // Unblocks every pending read and write. Callable from any thread.
    void abort();

    const ConnectionSession& session() const { return session_; }

private:
    ExitReason serve();
    ExitReason serve_http();
    ExitReason handshake_io_exit(IoStatus status, const char* stage);
    void connect_upstream(const IpAddress& target, uint16_t port);
    bool relay();
    void pump(int from, int to, bool client_to_upstream, std::vector<char>& buffer,
              std::atomic<bool>& failed);
    void reply_and_close(ReplyCode code);
    void send_http_error(int status);
    void send_and_linger(const void* data, size_t len);
    void close_sockets();

    Socket client_;
    Socket upstream_;
    std::mutex sockets_mutex_;
    std::atomic<bool> aborted_{false};

    const ProxyConfig& config_;
    Resolver& resolver_;
    ProxyStats& stats_;
    Logger& logger_;
    ConnectionSession session_;
};
