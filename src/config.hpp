#pragma once
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct RuntimeConfig {
    // RPC retry policy: first resend after rpc_timeout_ms, doubling per
    // attempt up to rpc_max_backoff_ms, delivery failure after rpc_max_retries resends.
    int rpc_timeout_ms = 250;
    int rpc_max_backoff_ms = 2000;
    int rpc_max_retries = 5;

    int max_recv_per_tick = 64;
    int idle_wait_ms = 5;
    int reply_cache_size = 4096;
};

struct BroadcastConfig {
    int gossip_interval_ms = 200;
    int max_gossip_batch = 1024;
};

struct CounterConfig {
    int anti_entropy_interval_ms = 500;
};

struct LoggingConfig {
    bool verbose = false;
    std::string message_log_file;
};

struct NodeConfig {
    RuntimeConfig runtime;
    BroadcastConfig broadcast;
    CounterConfig counter;
    LoggingConfig logging;
};

// Clamp intervals that would make the loop spin or never fire.
inline void sanitize_config(NodeConfig& config, std::ostream& diag = std::cerr) {
    auto at_least = [&diag](int& value, int min, const char* name) {
        if (value < min) {
            diag << "Warning: " << name << " (" << value << ") is below " << min
                 << ", using " << min << "\n";
            value = min;
        }
    };
    at_least(config.runtime.rpc_timeout_ms, 1, "rpc_timeout_ms");
    at_least(config.runtime.rpc_max_backoff_ms, config.runtime.rpc_timeout_ms, "rpc_max_backoff_ms");
    at_least(config.runtime.rpc_max_retries, 0, "rpc_max_retries");
    at_least(config.runtime.max_recv_per_tick, 1, "max_recv_per_tick");
    at_least(config.runtime.idle_wait_ms, 0, "idle_wait_ms");
    at_least(config.runtime.reply_cache_size, 0, "reply_cache_size");
    at_least(config.broadcast.gossip_interval_ms, 1, "gossip_interval_ms");
    at_least(config.broadcast.max_gossip_batch, 1, "max_gossip_batch");
    at_least(config.counter.anti_entropy_interval_ms, 1, "anti_entropy_interval_ms");
}

// Missing keys keep their defaults. A missing or unparsable file yields the
// defaults with a diagnostic; the node still starts.
inline NodeConfig load_config(const std::string& path, std::ostream& diag = std::cerr) {
    NodeConfig config;

    if (path.empty()) return config;

    std::ifstream file(path);
    if (!file.is_open()) {
        diag << "Warning: Could not open config file '" << path << "', using defaults\n";
        return config;
    }

    try {
        json j = json::parse(file);

        if (j.contains("runtime")) {
            auto& rt = j["runtime"];
            if (rt.contains("rpc_timeout_ms")) config.runtime.rpc_timeout_ms = rt["rpc_timeout_ms"];
            if (rt.contains("rpc_max_backoff_ms")) config.runtime.rpc_max_backoff_ms = rt["rpc_max_backoff_ms"];
            if (rt.contains("rpc_max_retries")) config.runtime.rpc_max_retries = rt["rpc_max_retries"];
            if (rt.contains("max_recv_per_tick")) config.runtime.max_recv_per_tick = rt["max_recv_per_tick"];
            if (rt.contains("idle_wait_ms")) config.runtime.idle_wait_ms = rt["idle_wait_ms"];
            if (rt.contains("reply_cache_size")) config.runtime.reply_cache_size = rt["reply_cache_size"];
        }

        if (j.contains("broadcast")) {
            auto& bc = j["broadcast"];
            if (bc.contains("gossip_interval_ms")) config.broadcast.gossip_interval_ms = bc["gossip_interval_ms"];
            if (bc.contains("max_gossip_batch")) config.broadcast.max_gossip_batch = bc["max_gossip_batch"];
        }

        if (j.contains("counter")) {
            auto& ctr = j["counter"];
            if (ctr.contains("anti_entropy_interval_ms")) config.counter.anti_entropy_interval_ms = ctr["anti_entropy_interval_ms"];
        }

        if (j.contains("logging")) {
            auto& log = j["logging"];
            if (log.contains("verbose")) config.logging.verbose = log["verbose"];
            if (log.contains("message_log_file")) config.logging.message_log_file = log["message_log_file"].get<std::string>();
        }
    } catch (const json::exception& e) {
        diag << "Error parsing config file: " << e.what() << "\n";
        return NodeConfig{};
    }

    sanitize_config(config, diag);
    return config;
}
