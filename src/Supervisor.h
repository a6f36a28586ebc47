#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include "Logger.h"
#include "ProxyConfig.h"
#include "ProxyStats.h"
#include "utils.h"

enum class SupervisorState {
    STARTING,
    RUNNING,
    DRAINING,
    STOPPED
};

const char* supervisor_state_name(SupervisorState state);

// Bytes per second over a sliding window of (time, cumulative bytes) samples.
class BandwidthMeter {
public:
    explicit BandwidthMeter(std::chrono::milliseconds window = std::chrono::seconds(5))
        : window_(window) {}

    void add_sample(std::chrono::steady_clock::time_point when, uint64_t total_bytes);
    double bytes_per_second() const;

private:
    std::chrono::milliseconds window_;
    std::deque<std::pair<std::chrono::steady_clock::time_point, uint64_t>> samples_;
};

struct WorkerHandle {
    int slot = 0;
    pid_t process_id = -1;
    std::chrono::steady_clock::time_point spawn_time;
    int restart_count = 0;
    StatsSnapshot last_known_stats;
    // final snapshots of earlier incarnations of this slot
    StatsSnapshot retired_totals;
    Socket control;
    std::string inbox;
    bool alive = false;
    bool draining = false;
    bool retired = false;
    // delay before the next spawn of this slot, grown by repeated start failures
    std::chrono::milliseconds respawn_backoff{0};
    std::chrono::steady_clock::time_point respawn_at;
};

// Delay before respawning a worker that exited with wait status status.
// Listener and fatal startup failures back off exponentially from 250 ms up
// to 30 s; any other exit resets the delay to zero.
std::chrono::milliseconds next_respawn_backoff(int status, std::chrono::milliseconds previous);

struct WorkerStatus {
    int slot = 0;
    pid_t process_id = -1;
    bool alive = false;
    int restart_count = 0;
    uint64_t active_connections = 0;
};

struct AggregateStats {
    StatsSnapshot totals;
    std::vector<WorkerStatus> workers;
    int total_restarts = 0;
    int live_workers = 0;
    double bandwidth_bps = 0.0;
    std::chrono::seconds uptime{0};
    SupervisorState state = SupervisorState::STARTING;
};

// Owns the listening socket and a pool of forked worker processes sharing it.
class Supervisor {
public:
    // Throws InvalidConfig.
    Supervisor(const ProxyConfig& config, Logger& logger);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Creates the listener and spawns the workers. Throws BindError before
    // any worker exists.
    void start();

    // Never blocks on the workers.
    AggregateStats current_stats() const;

    // Begins draining. Idempotent, callable from any thread or after a signal.
    void shutdown();

    // Blocks until every worker is reaped and the listener is closed.
    void wait_until_stopped();

    SupervisorState state() const { return state_; }

    // Actual port, useful when the config asked for port 0.
    int listen_port() const { return listen_port_; }

    // pids of the live workers, in slot order.
    std::vector<pid_t> worker_pids() const;

private:
    void create_listener();
    bool spawn_worker(WorkerHandle& worker);
    void monitor_loop();
    void poll_control_channels(int timeout_ms);
    void read_control(WorkerHandle& worker);
    void reap_workers(bool respawn);
    void on_worker_exit(WorkerHandle& worker, int status);
    void record_bandwidth();
    void drain_workers();
    void finish();

    ProxyConfig config_;
    Logger& logger_;

    Socket listener_;
    int listen_port_ = 0;
    int wake_pipe_[2] = {-1, -1};

    std::atomic<SupervisorState> state_{SupervisorState::STARTING};
    std::atomic<bool> shutdown_requested_{false};
    std::chrono::steady_clock::time_point start_time_;

    mutable std::mutex mutex_;
    std::condition_variable stopped_cv_;
    bool started_ = false;
    std::vector<WorkerHandle> workers_;
    BandwidthMeter bandwidth_;

    std::thread monitor_;
    std::once_flag join_once_;
};

// Validates, binds and spawns; returns a running supervisor.
// Throws BindError or InvalidConfig before any worker exists.
std::unique_ptr<Supervisor> create_proxy_server(const std::string& bind_address, int port,
                                                int worker_count);
std::unique_ptr<Supervisor> create_proxy_server(const ProxyConfig& config, Logger& logger);
