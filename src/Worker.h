#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "ConnectionHandler.h"
#include "Logger.h"
#include "ProxyConfig.h"
#include "ProxyStats.h"
#include "Resolver.h"

// Process exit statuses of a worker.
constexpr int WORKER_EXIT_OK = 0;
constexpr int WORKER_EXIT_LISTENER_FAILED = 3;
constexpr int WORKER_EXIT_FATAL = 4;

// Builds the newline-terminated control message a worker reports its
// counters with, and the drain command the supervisor sends back.
std::string encode_stats_message(const StatsSnapshot& stats, bool draining);
std::string encode_drain_message();

// Accepts connections on a listener it does not own and runs one
// ConnectionHandler thread per connection.
class Worker {
public:
    Worker(const ProxyConfig& config, int listener_fd, Logger& logger);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Stats reports go out on this descriptor and drain commands come in on
    // it. Not owned. Must be called before run().
    void attach_control_channel(int fd) { control_fd_ = fd; }

    // Accept loop, then drain. Returns one of the WORKER_EXIT_* codes.
    int run();

    // Stops accepting and starts draining. Callable from any thread.
    void request_stop();

    bool stopping() const { return stop_requested_; }
    StatsSnapshot stats() const { return stats_.snapshot(); }
    size_t active_handlers() const;

private:
    int accept_loop();
    bool accept_one();
    void dispatch(Socket client, const sockaddr_storage& addr);
    void drain();

    void control_loop();
    void handle_control_input(const std::string& line);
    bool report_stats();

    ProxyConfig config_;
    int listener_fd_;
    Logger& logger_;
    ProxyStats stats_;
    Resolver resolver_;

    int wake_pipe_[2] = {-1, -1};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> finished_{false};

    int control_fd_ = -1;
    std::string control_inbox_;

    mutable std::mutex handlers_mutex_;
    std::condition_variable handlers_cv_;
    std::map<uint64_t, std::shared_ptr<ConnectionHandler>> handlers_;
    uint64_t next_handler_id_ = 0;
};

// Entry point of a forked worker process. Returns the exit status.
int run_worker_process(const ProxyConfig& config, int listener_fd, int control_fd, int slot,
                       Logger& logger);
