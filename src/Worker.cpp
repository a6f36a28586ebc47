#include "Worker.h"

#include <cerrno>
#include <csignal>
#include <system_error>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "Errors.h"

std::string encode_stats_message(const StatsSnapshot& stats, bool draining) {
    nlohmann::json message = {
        {"type", "stats"},
        {"stats", stats},
        {"draining", draining},
    };
    return message.dump() + "\n";
}

std::string encode_drain_message() {
    return nlohmann::json{{"type", "drain"}}.dump() + "\n";
}

Worker::Worker(const ProxyConfig& config, int listener_fd, Logger& logger)
    : config_(config), listener_fd_(listener_fd), logger_(logger), resolver_(config_, logger) {
    if (pipe2(wake_pipe_, O_CLOEXEC | O_NONBLOCK) < 0) {
        throw ProxyError("Failed to create worker wake pipe: " + errno_string(errno));
    }
}

Worker::~Worker() {
    for (int fd : wake_pipe_) {
        if (fd >= 0) {
            close(fd);
        }
    }
}

void Worker::request_stop() {
    if (stop_requested_.exchange(true)) {
        return;
    }
    char wake = 1;
    if (write(wake_pipe_[1], &wake, 1) < 0 && errno != EAGAIN) {
        logger_.log(LogLevel::ERROR, "Failed to wake accept loop: " + errno_string(errno));
    }
}

size_t Worker::active_handlers() const {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    return handlers_.size();
}

int Worker::run() {
    std::thread control;
    if (control_fd_ >= 0) {
        control = std::thread(&Worker::control_loop, this);
    }

    int status = accept_loop();
    drain();

    finished_ = true;
    if (control.joinable()) {
        control.join();
    }
    if (control_fd_ >= 0) {
        report_stats();
    }

    StatsSnapshot s = stats_.snapshot();
    logger_.log(LogLevel::INFO,
                "Worker stopped: " + std::to_string(s.total_connections) + " connections, " +
                std::to_string(s.total_bytes_out) + " bytes out, " +
                std::to_string(s.total_bytes_in) + " bytes in, " +
                std::to_string(s.total_errors) + " errors");
    return status;
}

int Worker::accept_loop() {
    if (!set_non_blocking(listener_fd_, true)) {
        logger_.log(LogLevel::CRITICAL, "Listener unusable: " + errno_string(errno));
        return WORKER_EXIT_LISTENER_FAILED;
    }
    logger_.log(LogLevel::INFO, "Worker accepting connections");

    pollfd fds[2];
    fds[0] = {listener_fd_, POLLIN, 0};
    fds[1] = {wake_pipe_[0], POLLIN, 0};

    while (!stop_requested_) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            logger_.log(LogLevel::CRITICAL, "poll on listener failed: " + errno_string(errno));
            return WORKER_EXIT_LISTENER_FAILED;
        }
        if (fds[1].revents != 0) {
            break;
        }
        if (fds[0].revents & (POLLERR | POLLNVAL)) {
            logger_.log(LogLevel::CRITICAL, "Listener reported an error condition");
            return WORKER_EXIT_LISTENER_FAILED;
        }
        if ((fds[0].revents & POLLIN) && !accept_one()) {
            return WORKER_EXIT_LISTENER_FAILED;
        }
    }
    logger_.log(LogLevel::INFO, "Worker stopped accepting, draining");
    return WORKER_EXIT_OK;
}

bool Worker::accept_one() {
    sockaddr_storage client_addr{};
    socklen_t client_len = sizeof(client_addr);
    int client_fd = accept4(listener_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len,
                            SOCK_CLOEXEC);
    if (client_fd < 0) {
        switch (errno) {
            // another worker won the race, or the client gave up already
            case EAGAIN:
            case EINTR:
            case ECONNABORTED:
            case EPROTO:
                return true;
            case EMFILE:
            case ENFILE:
            case ENOBUFS:
            case ENOMEM:
                logger_.log(LogLevel::WARNING, "Accept failed: " + errno_string(errno) + ", backing off");
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                return true;
            default:
                logger_.log(LogLevel::CRITICAL, "Accept failed: " + errno_string(errno));
                return false;
        }
    }

    Socket client(client_fd);
    logger_.log(LogLevel::DEBUG, "New connection accepted", endpoint_to_string(client_addr));
    dispatch(std::move(client), client_addr);
    return true;
}

void Worker::dispatch(Socket client, const sockaddr_storage& addr) {
    auto handler = std::make_shared<ConnectionHandler>(std::move(client), addr, config_, resolver_,
                                                       stats_, logger_);
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        id = next_handler_id_++;
        handlers_[id] = handler;
    }

    try {
        std::thread([this, id, handler]() {
            handler->run();
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handlers_.erase(id);
            handlers_cv_.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        logger_.log(LogLevel::ERROR, std::string("Failed to start connection thread: ") + e.what());
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handlers_.erase(id);
        stats_.connection_started();
        stats_.connection_ended();
        stats_.error();
    }
}

void Worker::drain() {
    std::unique_lock<std::mutex> lock(handlers_mutex_);
    if (handlers_.empty()) {
        return;
    }
    logger_.log(LogLevel::INFO, "Waiting up to " + std::to_string(config_.grace_period.count()) +
                " ms for " + std::to_string(handlers_.size()) + " connections");
    if (handlers_cv_.wait_for(lock, config_.grace_period, [this] { return handlers_.empty(); })) {
        return;
    }

    logger_.log(LogLevel::WARNING, "Grace period expired, closing " + std::to_string(handlers_.size()) +
                " connections");
    for (auto& entry : handlers_) {
        entry.second->abort();
    }
    handlers_cv_.wait(lock, [this] { return handlers_.empty(); });
}

void Worker::control_loop() {
    bool channel_open = true;
    auto next_report = std::chrono::steady_clock::now();
    char buffer[1024];

    while (!finished_) {
        auto now = std::chrono::steady_clock::now();
        if (now >= next_report) {
            if (!report_stats() && channel_open) {
                logger_.log(LogLevel::WARNING, "Supervisor unreachable, draining");
                channel_open = false;
                request_stop();
            }
            next_report = now + config_.stats_interval;
        }

        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
            next_report - std::chrono::steady_clock::now());
        // a negative fd turns the poll into a plain sleep once the channel is gone
        pollfd pfd{channel_open ? control_fd_ : -1, POLLIN, 0};
        int ready = poll(&pfd, 1, poll_timeout_ms(wait));
        if (ready < 0) {
            if (errno == EINTR) continue;
            logger_.log(LogLevel::ERROR, "poll on control channel failed: " + errno_string(errno));
            request_stop();
            return;
        }
        if (ready == 0 || !channel_open) {
            continue;
        }

        ssize_t bytes = recv(control_fd_, buffer, sizeof(buffer), 0);
        if (bytes <= 0) {
            if (bytes < 0 && errno == EINTR) continue;
            logger_.log(LogLevel::WARNING, "Control channel closed, draining");
            channel_open = false;
            request_stop();
            continue;
        }
        control_inbox_.append(buffer, static_cast<size_t>(bytes));
        size_t newline;
        while ((newline = control_inbox_.find('\n')) != std::string::npos) {
            std::string line = control_inbox_.substr(0, newline);
            control_inbox_.erase(0, newline + 1);
            handle_control_input(line);
        }
    }
}

void Worker::handle_control_input(const std::string& line) {
    try {
        auto message = nlohmann::json::parse(line);
        std::string type = message.value("type", "");
        if (type == "drain") {
            logger_.log(LogLevel::INFO, "Drain requested by supervisor");
            request_stop();
        } else {
            logger_.log(LogLevel::WARNING, "Unknown control message type '" + type + "'");
        }
    } catch (const nlohmann::json::exception& e) {
        logger_.log(LogLevel::WARNING, std::string("Malformed control message: ") + e.what());
    }
}

bool Worker::report_stats() {
    std::string message = encode_stats_message(stats_.snapshot(), stop_requested_);
    return send_all(control_fd_, message.data(), message.size());
}

int run_worker_process(const ProxyConfig& config, int listener_fd, int control_fd, int slot,
                       Logger& logger) {
    logger.set_tag("worker-" + std::to_string(slot));

    // Ctrl-C reaches the whole process group; shutdown is the supervisor's call.
    signal(SIGINT, SIG_IGN);
    signal(SIGPIPE, SIG_IGN);
    signal(SIGTERM, SIG_DFL);
    sigset_t unblock;
    sigemptyset(&unblock);
    sigaddset(&unblock, SIGTERM);
    sigaddset(&unblock, SIGINT);
    pthread_sigmask(SIG_UNBLOCK, &unblock, nullptr);

    try {
        Worker worker(config, listener_fd, logger);
        worker.attach_control_channel(control_fd);
        return worker.run();
    } catch (const std::exception& e) {
        logger.log(LogLevel::CRITICAL, std::string("Worker failed: ") + e.what());
        return WORKER_EXIT_FATAL;
    }
}
