#include "ProxyStats.h"

void to_json(nlohmann::json& j, const StatsSnapshot& s) {
    j = nlohmann::json{
        {"active_connections", s.active_connections},
        {"total_connections", s.total_connections},
        {"total_bytes_in", s.total_bytes_in},
        {"total_bytes_out", s.total_bytes_out},
        {"total_errors", s.total_errors},
    };
}

void from_json(const nlohmann::json& j, StatsSnapshot& s) {
    s.active_connections = j.value("active_connections", uint64_t{0});
    s.total_connections = j.value("total_connections", uint64_t{0});
    s.total_bytes_in = j.value("total_bytes_in", uint64_t{0});
    s.total_bytes_out = j.value("total_bytes_out", uint64_t{0});
    s.total_errors = j.value("total_errors", uint64_t{0});
}
