#include "Supervisor.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "Errors.h"
#include "Worker.h"

namespace {

// Extra time on top of the grace period for workers to abort their
// remaining relays and report before they are killed.
constexpr std::chrono::seconds KILL_MARGIN{2};
constexpr int MONITOR_TICK_MS = 100;
constexpr std::chrono::milliseconds MIN_RESPAWN_BACKOFF{250};
constexpr std::chrono::milliseconds MAX_RESPAWN_BACKOFF{30000};

std::string describe_exit(int status) {
    if (WIFEXITED(status)) {
        switch (WEXITSTATUS(status)) {
            case WORKER_EXIT_OK: return "exited cleanly";
            case WORKER_EXIT_LISTENER_FAILED: return "exited after a listener failure";
            case WORKER_EXIT_FATAL: return "exited after a fatal error";
            default: return "exited with status " + std::to_string(WEXITSTATUS(status));
        }
    }
    if (WIFSIGNALED(status)) {
        return std::string("killed by signal ") + strsignal(WTERMSIG(status));
    }
    return "stopped with raw status " + std::to_string(status);
}

Logger& default_logger() {
    static Logger logger(LogLevel::INFO);
    return logger;
}

} // namespace

const char* supervisor_state_name(SupervisorState state) {
    switch (state) {
        case SupervisorState::STARTING: return "starting";
        case SupervisorState::RUNNING: return "running";
        case SupervisorState::DRAINING: return "draining";
        case SupervisorState::STOPPED: return "stopped";
        default: return "unknown";
    }
}

std::chrono::milliseconds next_respawn_backoff(int status, std::chrono::milliseconds previous) {
    if (!WIFEXITED(status)) {
        return std::chrono::milliseconds(0);
    }
    const int code = WEXITSTATUS(status);
    if (code != WORKER_EXIT_LISTENER_FAILED && code != WORKER_EXIT_FATAL) {
        return std::chrono::milliseconds(0);
    }
    if (previous < MIN_RESPAWN_BACKOFF) {
        return MIN_RESPAWN_BACKOFF;
    }
    return std::min(previous * 2, MAX_RESPAWN_BACKOFF);
}

void BandwidthMeter::add_sample(std::chrono::steady_clock::time_point when, uint64_t total_bytes) {
    samples_.emplace_back(when, total_bytes);
    while (samples_.size() > 1 && when - samples_.front().first > window_) {
        samples_.pop_front();
    }
}

double BandwidthMeter::bytes_per_second() const {
    if (samples_.size() < 2) {
        return 0.0;
    }
    const auto& first = samples_.front();
    const auto& last = samples_.back();
    double seconds = std::chrono::duration<double>(last.first - first.first).count();
    if (seconds <= 0.0 || last.second < first.second) {
        return 0.0;
    }
    return static_cast<double>(last.second - first.second) / seconds;
}

Supervisor::Supervisor(const ProxyConfig& config, Logger& logger)
    : config_(config), logger_(logger), start_time_(std::chrono::steady_clock::now()) {
    config_.validate();
    if (pipe2(wake_pipe_, O_CLOEXEC | O_NONBLOCK) < 0) {
        throw ProxyError("Failed to create supervisor wake pipe: " + errno_string(errno));
    }
}

Supervisor::~Supervisor() {
    shutdown();
    wait_until_stopped();
    for (int fd : wake_pipe_) {
        if (fd >= 0) {
            close(fd);
        }
    }
}

void Supervisor::create_listener() {
    auto address = IpAddress::parse(config_.bind_address);
    if (!address) {
        throw InvalidConfig("bind_address '" + config_.bind_address + "' is not an IP address");
    }

    Socket sock(socket(address->family(), SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock.valid()) {
        int err = errno;
        throw BindError("Failed to create listening socket: " + errno_string(err), err);
    }

    int opt = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        int err = errno;
        throw BindError("setsockopt SO_REUSEADDR failed: " + errno_string(err), err);
    }

    sockaddr_storage addr{};
    socklen_t addr_len = address->to_sockaddr(static_cast<uint16_t>(config_.port), addr);
    if (bind(sock.get(), reinterpret_cast<sockaddr*>(&addr), addr_len) < 0) {
        int err = errno;
        throw BindError("Failed to bind " + endpoint_to_string(addr) + ": " + errno_string(err), err);
    }
    if (listen(sock.get(), config_.listen_backlog) < 0) {
        int err = errno;
        throw BindError("Failed to listen on " + endpoint_to_string(addr) + ": " + errno_string(err), err);
    }
    // workers poll the shared listener and race for each connection
    if (!set_non_blocking(sock.get(), true)) {
        int err = errno;
        throw BindError("Failed to make listener non-blocking: " + errno_string(err), err);
    }

    sockaddr_storage bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(sock.get(), reinterpret_cast<sockaddr*>(&bound), &bound_len) < 0) {
        int err = errno;
        throw BindError("getsockname on listener failed: " + errno_string(err), err);
    }
    listen_port_ = endpoint_port(bound);
    listener_ = std::move(sock);
    logger_.log(LogLevel::INFO, "SOCKS5 proxy listening on " + endpoint_to_string(bound));
}

void Supervisor::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_ || state_ != SupervisorState::STARTING) {
            throw ProxyError("Supervisor already started");
        }
        create_listener();

        workers_.resize(static_cast<size_t>(config_.worker_count));
        for (size_t i = 0; i < workers_.size(); ++i) {
            workers_[i].slot = static_cast<int>(i);
            spawn_worker(workers_[i]);
        }
        started_ = true;
        state_ = SupervisorState::RUNNING;
    }
    logger_.log(LogLevel::INFO, "Started " + std::to_string(config_.worker_count) + " workers");

    if (shutdown_requested_) {
        SupervisorState expected = SupervisorState::RUNNING;
        state_.compare_exchange_strong(expected, SupervisorState::DRAINING);
    }
    monitor_ = std::thread(&Supervisor::monitor_loop, this);
}

bool Supervisor::spawn_worker(WorkerHandle& worker) {
    int channel[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, channel) < 0) {
        logger_.log(LogLevel::ERROR, "socketpair for worker " + std::to_string(worker.slot) +
                    " failed: " + errno_string(errno));
        return false;
    }

    pid_t pid;
    {
        Logger::ForkGuard guard(logger_);
        pid = fork();
    }

    if (pid == 0) {
        close(channel[0]);
        for (auto& other : workers_) {
            if (other.control.valid()) {
                close(other.control.release());
            }
        }
        close(wake_pipe_[0]);
        close(wake_pipe_[1]);
        int code = run_worker_process(config_, listener_.get(), channel[1], worker.slot, logger_);
        _exit(code);
    }

    close(channel[1]);
    if (pid < 0) {
        logger_.log(LogLevel::ERROR, "fork for worker " + std::to_string(worker.slot) +
                    " failed: " + errno_string(errno));
        close(channel[0]);
        return false;
    }

    set_non_blocking(channel[0], true);
    worker.control.reset(channel[0]);
    worker.inbox.clear();
    worker.process_id = pid;
    worker.spawn_time = std::chrono::steady_clock::now();
    worker.last_known_stats = StatsSnapshot();
    worker.alive = true;
    worker.draining = false;
    logger_.log(LogLevel::INFO, "Worker " + std::to_string(worker.slot) + " started with pid " +
                std::to_string(pid));
    return true;
}

void Supervisor::monitor_loop() {
    while (state_ == SupervisorState::RUNNING) {
        poll_control_channels(MONITOR_TICK_MS);

        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SupervisorState::RUNNING) {
            break;
        }
        reap_workers(true);
        const auto now = std::chrono::steady_clock::now();
        for (auto& worker : workers_) {
            // slots backing off, or whose last fork failed
            if (!worker.alive && !worker.retired && now >= worker.respawn_at) {
                spawn_worker(worker);
            }
        }
        record_bandwidth();
    }

    drain_workers();
    finish();
}

void Supervisor::poll_control_channels(int timeout_ms) {
    std::vector<pollfd> fds;
    std::vector<size_t> owners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < workers_.size(); ++i) {
            if (workers_[i].control.valid()) {
                fds.push_back({workers_[i].control.get(), POLLIN, 0});
                owners.push_back(i);
            }
        }
    }
    fds.push_back({wake_pipe_[0], POLLIN, 0});

    int ready = poll(fds.data(), fds.size(), timeout_ms);
    if (ready < 0) {
        if (errno != EINTR) {
            logger_.log(LogLevel::ERROR, "poll on control channels failed: " + errno_string(errno));
        }
        return;
    }
    if (ready == 0) {
        return;
    }

    if (fds.back().revents != 0) {
        char discard[64];
        while (read(wake_pipe_[0], discard, sizeof(discard)) > 0) {
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < owners.size(); ++i) {
        if (fds[i].revents != 0) {
            read_control(workers_[owners[i]]);
        }
    }
}

void Supervisor::read_control(WorkerHandle& worker) {
    char buffer[4096];
    while (worker.control.valid()) {
        ssize_t bytes = recv(worker.control.get(), buffer, sizeof(buffer), 0);
        if (bytes < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                logger_.log(LogLevel::DEBUG, "Control channel of worker " + std::to_string(worker.slot) +
                            " failed: " + errno_string(errno));
                worker.control.reset();
            }
            break;
        }
        if (bytes == 0) {
            worker.control.reset();
            break;
        }
        worker.inbox.append(buffer, static_cast<size_t>(bytes));
    }

    size_t newline;
    while ((newline = worker.inbox.find('\n')) != std::string::npos) {
        std::string line = worker.inbox.substr(0, newline);
        worker.inbox.erase(0, newline + 1);
        try {
            auto message = nlohmann::json::parse(line);
            if (message.value("type", "") == "stats") {
                worker.last_known_stats = message.at("stats").get<StatsSnapshot>();
                worker.draining = message.value("draining", false);
            }
        } catch (const nlohmann::json::exception& e) {
            logger_.log(LogLevel::WARNING, "Malformed report from worker " + std::to_string(worker.slot) +
                        ": " + e.what());
        }
    }
}

void Supervisor::reap_workers(bool respawn) {
    for (auto& worker : workers_) {
        if (!worker.alive) {
            continue;
        }
        int status = 0;
        pid_t result = waitpid(worker.process_id, &status, WNOHANG);
        if (result == 0) {
            continue;
        }
        if (result < 0) {
            if (errno == EINTR) continue;
            logger_.log(LogLevel::ERROR, "waitpid for worker " + std::to_string(worker.slot) +
                        " failed: " + errno_string(errno));
        }
        on_worker_exit(worker, status);

        if (!respawn) {
            continue;
        }
        if (config_.max_restarts > 0 && worker.restart_count >= config_.max_restarts) {
            worker.retired = true;
            logger_.log(LogLevel::ERROR, "Worker " + std::to_string(worker.slot) + " exceeded " +
                        std::to_string(config_.max_restarts) + " restarts, slot retired");
            continue;
        }
        worker.restart_count += 1;
        worker.respawn_backoff = next_respawn_backoff(status, worker.respawn_backoff);
        if (worker.respawn_backoff.count() > 0) {
            worker.respawn_at = std::chrono::steady_clock::now() + worker.respawn_backoff;
            logger_.log(LogLevel::WARNING, "Restarting worker " + std::to_string(worker.slot) + " in " +
                        std::to_string(worker.respawn_backoff.count()) + " ms (restart " +
                        std::to_string(worker.restart_count) + ")");
            continue;
        }
        logger_.log(LogLevel::WARNING, "Restarting worker " + std::to_string(worker.slot) +
                    " (restart " + std::to_string(worker.restart_count) + ")");
        spawn_worker(worker);
    }
}

void Supervisor::on_worker_exit(WorkerHandle& worker, int status) {
    // collect whatever it reported before dying
    read_control(worker);

    StatsSnapshot last = worker.last_known_stats;
    last.active_connections = 0;
    worker.retired_totals += last;
    worker.last_known_stats = StatsSnapshot();
    worker.control.reset();
    worker.inbox.clear();
    worker.alive = false;

    LogLevel level = state_ == SupervisorState::RUNNING ? LogLevel::WARNING : LogLevel::INFO;
    logger_.log(level, "Worker " + std::to_string(worker.slot) + " (pid " +
                std::to_string(worker.process_id) + ") " + describe_exit(status));
    worker.process_id = -1;
}

void Supervisor::record_bandwidth() {
    StatsSnapshot totals;
    for (const auto& worker : workers_) {
        totals += worker.retired_totals;
        totals += worker.last_known_stats;
    }
    bandwidth_.add_sample(std::chrono::steady_clock::now(), totals.total_bytes_in + totals.total_bytes_out);
}

void Supervisor::drain_workers() {
    logger_.log(LogLevel::INFO, "Draining workers");
    const std::string drain = encode_drain_message();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& worker : workers_) {
            if (worker.alive && worker.control.valid() &&
                !send_all(worker.control.get(), drain.data(), drain.size())) {
                logger_.log(LogLevel::DEBUG, "Could not send drain to worker " + std::to_string(worker.slot) +
                            ": " + errno_string(errno));
            }
        }
    }

    const auto deadline = std::chrono::steady_clock::now() + config_.grace_period + KILL_MARGIN;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reap_workers(false);
            record_bandwidth();
            bool any_alive = false;
            for (const auto& worker : workers_) {
                any_alive = any_alive || worker.alive;
            }
            if (!any_alive) {
                return;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        poll_control_channels(MONITOR_TICK_MS / 2);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& worker : workers_) {
        if (!worker.alive) {
            continue;
        }
        logger_.log(LogLevel::WARNING, "Worker " + std::to_string(worker.slot) + " (pid " +
                    std::to_string(worker.process_id) + ") did not stop in time, killing it");
        kill(worker.process_id, SIGKILL);
        int status = 0;
        while (waitpid(worker.process_id, &status, 0) < 0 && errno == EINTR) {
        }
        on_worker_exit(worker, status);
    }
}

void Supervisor::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_.reset();
        state_ = SupervisorState::STOPPED;
    }
    stopped_cv_.notify_all();
    logger_.log(LogLevel::INFO, "Proxy stopped");
}

AggregateStats Supervisor::current_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    AggregateStats stats;
    for (const auto& worker : workers_) {
        stats.totals += worker.retired_totals;
        stats.totals += worker.last_known_stats;

        WorkerStatus status;
        status.slot = worker.slot;
        status.process_id = worker.process_id;
        status.alive = worker.alive;
        status.restart_count = worker.restart_count;
        status.active_connections = worker.last_known_stats.active_connections;
        stats.workers.push_back(status);

        stats.total_restarts += worker.restart_count;
        if (worker.alive) {
            stats.live_workers += 1;
        }
    }
    stats.bandwidth_bps = bandwidth_.bytes_per_second();
    stats.uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_);
    stats.state = state_;
    return stats;
}

std::vector<pid_t> Supervisor::worker_pids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<pid_t> pids;
    for (const auto& worker : workers_) {
        if (worker.alive) {
            pids.push_back(worker.process_id);
        }
    }
    return pids;
}

void Supervisor::shutdown() {
    shutdown_requested_ = true;
    SupervisorState expected = SupervisorState::RUNNING;
    if (!state_.compare_exchange_strong(expected, SupervisorState::DRAINING)) {
        return;
    }
    logger_.log(LogLevel::INFO, "Shutdown requested");
    char wake = 1;
    if (write(wake_pipe_[1], &wake, 1) < 0 && errno != EAGAIN) {
        logger_.log(LogLevel::ERROR, "Failed to wake monitor: " + errno_string(errno));
    }
}

void Supervisor::wait_until_stopped() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!started_) {
            // nothing was ever spawned
            listener_.reset();
            state_ = SupervisorState::STOPPED;
            return;
        }
        stopped_cv_.wait(lock, [this] { return state_ == SupervisorState::STOPPED; });
    }
    std::call_once(join_once_, [this] {
        if (monitor_.joinable()) {
            monitor_.join();
        }
    });
}

std::unique_ptr<Supervisor> create_proxy_server(const std::string& bind_address, int port,
                                                int worker_count) {
    ProxyConfig config;
    config.bind_address = bind_address;
    config.port = port;
    config.worker_count = worker_count;
    return create_proxy_server(config, default_logger());
}

std::unique_ptr<Supervisor> create_proxy_server(const ProxyConfig& config, Logger& logger) {
    auto supervisor = std::make_unique<Supervisor>(config, logger);
    supervisor->start();
    return supervisor;
}
