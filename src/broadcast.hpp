#pragma once
#include <algorithm>
#include <cstdint>
#include <limits>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "config.hpp"
#include "errors.hpp"
#include "messages.hpp"
#include "node.hpp"
#include "workload.hpp"

// Gossip dissemination with per-neighbor acknowledgment.
//
// Every delivered value is recorded once in the log and marked pending for
// each neighbor that is not known to have it. A periodic tick pushes each
// neighbor's pending values as one batch; only a gossip_ok from that neighbor
// clears them, so a dropped batch or a partitioned link is retried on the next
// tick for as long as it takes.
class BroadcastEngine : public Workload {
public:
    BroadcastEngine(Node& node, const BroadcastConfig& cfg)
        : node_(node), cfg_(cfg) {
        node_.on("broadcast", [this](const Message& m) { handle_broadcast(m); });
        node_.on("read", [this](const Message& m) { handle_read(m); });
        node_.on("topology", [this](const Message& m) { handle_topology(m); });
        node_.on("gossip", [this](const Message& m) { handle_gossip(m); });
        node_.on("gossip_ok", [this](const Message& m) { handle_gossip_ok(m); });
        node_.every(Millis(cfg_.gossip_interval_ms), [this] { gossip_tick(); });
    }

    const char* type_name() const override { return "broadcast"; }

    // Local delivery. Returns false when the value was already known.
    bool deliver(int64_t value) {
        ensure_neighbors();
        if (!log_.insert(value).second) return false;
        for (const auto& n : neighbors_) pending_[n].insert(value);
        return true;
    }

    // Values from a peer. The sender evidently has them, so they leave its
    // pending set; new values become pending for every other neighbor.
    // Returns how many values were new.
    std::size_t receive_gossip(const NodeId& from, const std::vector<int64_t>& values) {
        ensure_neighbors();
        std::size_t fresh = 0;
        auto from_pending = pending_.find(from);

        for (int64_t v : values) {
            if (from_pending != pending_.end()) from_pending->second.erase(v);
            if (!log_.insert(v).second) continue;
            fresh++;
            for (const auto& n : neighbors_) {
                if (n != from) pending_[n].insert(v);
            }
        }
        return fresh;
    }

    void acknowledge(const NodeId& from, const std::vector<int64_t>& values) {
        auto it = pending_.find(from);
        if (it == pending_.end()) return;
        for (int64_t v : values) it->second.erase(v);
    }

    // Replaces the neighbor set. Every known value becomes pending for a
    // newly added neighbor; pending sets of dropped neighbors are discarded.
    void set_neighbors(const std::vector<NodeId>& neighbors) {
        std::vector<NodeId> next;
        for (const auto& n : neighbors) {
            if (n == node_.id()) continue;
            if (std::find(next.begin(), next.end(), n) == next.end()) next.push_back(n);
        }

        std::map<NodeId, std::set<int64_t>> next_pending;
        for (const auto& n : next) {
            auto it = pending_.find(n);
            const bool known = std::find(neighbors_.begin(), neighbors_.end(), n) != neighbors_.end();
            if (known && it != pending_.end()) next_pending[n] = std::move(it->second);
            else next_pending[n] = log_;
        }

        neighbors_ = std::move(next);
        pending_ = std::move(next_pending);
        topology_set_ = true;
    }

    void gossip_tick() {
        ensure_neighbors();
        const std::size_t max_batch = static_cast<std::size_t>(cfg_.max_gossip_batch);

        for (const auto& kv : pending_) {
            if (kv.second.empty()) continue;

            json batch = json::array();
            for (int64_t v : kv.second) {
                if (batch.size() >= max_batch) break;
                batch.push_back(v);
            }
            node_.send(kv.first, make_body("gossip", {{"messages", std::move(batch)}}));
        }
    }

    std::vector<int64_t> read() const {
        return std::vector<int64_t>(log_.begin(), log_.end());
    }

    bool contains(int64_t value) const { return log_.count(value) != 0; }

    const std::vector<NodeId>& neighbors() const { return neighbors_; }

    const std::set<int64_t>& pending_for(const NodeId& neighbor) const {
        static const std::set<int64_t> empty;
        auto it = pending_.find(neighbor);
        return it == pending_.end() ? empty : it->second;
    }

private:
    // Until the harness assigns a topology, gossip to every other node.
    void ensure_neighbors() {
        if (topology_set_ || !neighbors_.empty() || !node_.initialized()) return;
        neighbors_ = node_.peers();
        for (const auto& n : neighbors_) pending_[n] = log_;
    }

    static int64_t parse_value(const json& v) {
        if (!v.is_number_integer()) {
            throw RpcError::malformed_request("broadcast value must be an integer, got " + v.dump());
        }
        if (v.is_number_unsigned() && v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw RpcError::malformed_request("broadcast value " + v.dump() + " is out of range");
        }
        return v.get<int64_t>();
    }

    static std::vector<int64_t> parse_values(const json& arr) {
        if (!arr.is_array()) {
            throw RpcError::malformed_request("'messages' must be an array");
        }
        std::vector<int64_t> out;
        out.reserve(arr.size());
        for (const auto& v : arr) out.push_back(parse_value(v));
        return out;
    }

    void handle_broadcast(const Message& m) {
        const int64_t value = parse_value(m.body.fields.at("message"));
        if (deliver(value)) {
            node_.logger().debug("← broadcast " + std::to_string(value) + " from " + m.src);
        }
        node_.reply(m, make_body("broadcast_ok"));
    }

    void handle_read(const Message& m) {
        node_.reply(m, make_body("read_ok", {{"messages", read()}}));
    }

    void handle_topology(const Message& m) {
        const json& topology = m.body.fields.at("topology");
        if (!topology.is_object()) {
            throw RpcError::malformed_request("'topology' must be an object");
        }
        auto mine = topology.find(node_.id());
        if (mine == topology.end() || !mine->is_array()) {
            throw RpcError::malformed_request("topology has no neighbor list for " + node_.id());
        }

        std::vector<NodeId> neighbors;
        for (const auto& n : *mine) neighbors.push_back(n.get<std::string>());
        set_neighbors(neighbors);

        node_.logger().debug("topology: " + std::to_string(neighbors_.size()) + " neighbors");
        node_.reply(m, make_body("topology_ok"));
    }

    void handle_gossip(const Message& m) {
        const json& batch = m.body.fields.at("messages");
        const std::size_t fresh = receive_gossip(m.src, parse_values(batch));
        if (fresh > 0) {
            node_.logger().debug("← gossip from " + m.src + ": " + std::to_string(fresh) + " new");
        }
        node_.reply(m, make_body("gossip_ok", {{"messages", batch}}));
    }

    void handle_gossip_ok(const Message& m) {
        acknowledge(m.src, parse_values(m.body.fields.at("messages")));
    }

    Node& node_;
    BroadcastConfig cfg_;

    std::set<int64_t> log_;
    std::vector<NodeId> neighbors_;
    bool topology_set_ = false;
    std::map<NodeId, std::set<int64_t>> pending_;
};
