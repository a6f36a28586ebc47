#pragma once
#include <atomic>
#include <cstdint>

#include <nlohmann/json.hpp>

struct StatsSnapshot {
    uint64_t active_connections = 0;
    uint64_t total_connections = 0;
    uint64_t total_bytes_in = 0;    // upstream -> client
    uint64_t total_bytes_out = 0;   // client -> upstream
    uint64_t total_errors = 0;

    StatsSnapshot& operator+=(const StatsSnapshot& other) {
        active_connections += other.active_connections;
        total_connections += other.total_connections;
        total_bytes_in += other.total_bytes_in;
        total_bytes_out += other.total_bytes_out;
        total_errors += other.total_errors;
        return *this;
    }
};

void to_json(nlohmann::json& j, const StatsSnapshot& s);
void from_json(const nlohmann::json& j, StatsSnapshot& s);

// Counters shared by every connection of one worker. Each field is atomic on
// its own; a snapshot is not atomic across fields.
struct ProxyStats {
    std::atomic<uint64_t> total_connections{0};
    std::atomic<uint64_t> active_connections{0};
    std::atomic<uint64_t> bytes_sent{0};
    std::atomic<uint64_t> bytes_received{0};
    std::atomic<uint64_t> total_errors{0};

    void connection_started() {
        // total first so a concurrent snapshot never sees active > total
        total_connections.fetch_add(1, std::memory_order_seq_cst);
        active_connections.fetch_add(1, std::memory_order_seq_cst);
    }

    void connection_ended() {
        active_connections.fetch_sub(1, std::memory_order_seq_cst);
    }

    void add_bytes_sent(uint64_t n) { bytes_sent.fetch_add(n, std::memory_order_relaxed); }
    void add_bytes_received(uint64_t n) { bytes_received.fetch_add(n, std::memory_order_relaxed); }
    void error() { total_errors.fetch_add(1, std::memory_order_relaxed); }

    // active is read before total; total only grows, so the snapshot keeps
    // active_connections <= total_connections.
    StatsSnapshot snapshot() const {
        StatsSnapshot s;
        s.active_connections = active_connections.load(std::memory_order_seq_cst);
        s.total_connections = total_connections.load(std::memory_order_seq_cst);
        s.total_bytes_in = bytes_received.load(std::memory_order_relaxed);
        s.total_bytes_out = bytes_sent.load(std::memory_order_relaxed);
        s.total_errors = total_errors.load(std::memory_order_relaxed);
        return s;
    }

    void reset() {
        total_connections = 0;
        active_connections = 0;
        bytes_sent = 0;
        bytes_received = 0;
        total_errors = 0;
    }
};

// Pairs connection_started() with exactly one connection_ended().
class ActiveConnectionGuard {
public:
    explicit ActiveConnectionGuard(ProxyStats& stats) : stats_(stats) {
        stats_.connection_started();
    }
    ~ActiveConnectionGuard() { stats_.connection_ended(); }

    ActiveConnectionGuard(const ActiveConnectionGuard&) = delete;
    ActiveConnectionGuard& operator=(const ActiveConnectionGuard&) = delete;

private:
    ProxyStats& stats_;
};
