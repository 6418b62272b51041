#pragma once
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include "config.hpp"
#include "errors.hpp"
#include "messages.hpp"
#include "node.hpp"
#include "workload.hpp"

// Grow-only counter: one non-negative, monotonic entry per node. The value is
// the sum of entries; merge is the element-wise maximum.
class GCounter {
public:
    using Entries = std::map<NodeId, int64_t>;

    // Throws RpcError(MALFORMED_REQUEST) on a negative or overflowing delta.
    void add(const NodeId& node, int64_t delta) {
        if (delta < 0) {
            throw RpcError::malformed_request("delta must be non-negative, got " + std::to_string(delta));
        }
        int64_t& entry = counts_[node];
        if (delta > std::numeric_limits<int64_t>::max() - entry) {
            throw RpcError::malformed_request("delta " + std::to_string(delta) + " overflows the counter");
        }
        entry += delta;
    }

    // Returns true if any entry grew. Never lowers an entry.
    bool merge(const Entries& other) {
        bool changed = false;
        for (const auto& kv : other) {
            int64_t& entry = counts_[kv.first];
            if (kv.second > entry) {
                entry = kv.second;
                changed = true;
            }
        }
        return changed;
    }

    bool merge(const GCounter& other) { return merge(other.counts_); }

    // Saturates rather than wrapping.
    int64_t value() const {
        int64_t sum = 0;
        for (const auto& kv : counts_) {
            if (kv.second > std::numeric_limits<int64_t>::max() - sum) {
                return std::numeric_limits<int64_t>::max();
            }
            sum += kv.second;
        }
        return sum;
    }

    int64_t get(const NodeId& node) const {
        auto it = counts_.find(node);
        return it == counts_.end() ? 0 : it->second;
    }

    const Entries& entries() const { return counts_; }

    json to_json() const { return json(counts_); }

    // All-or-nothing: any non-integer or negative entry rejects the snapshot.
    static Entries parse(const json& j) {
        if (!j.is_object()) {
            throw RpcError::malformed_request("counter snapshot must be an object");
        }
        Entries out;
        for (const auto& el : j.items()) {
            const json& v = el.value();
            const bool too_big = v.is_number_unsigned() &&
                                 v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
            if (!v.is_number_integer() || too_big || v.get<int64_t>() < 0) {
                throw RpcError::malformed_request("counter entry for " + el.key() + " is not a non-negative integer");
            }
            out[el.key()] = el.value().get<int64_t>();
        }
        return out;
    }

    bool operator==(const GCounter& other) const { return counts_ == other.counts_; }

private:
    Entries counts_;
};

// Replicates a GCounter by periodic anti-entropy: every node pushes its full
// state to every peer, receivers merge. Because a peer's snapshot may hold
// this node's own entry, a restarted node also recovers its previous count.
class CounterCrdt : public Workload {
public:
    CounterCrdt(Node& node, const CounterConfig& cfg)
        : node_(node), cfg_(cfg) {
        node_.on("add", [this](const Message& m) { handle_add(m); });
        node_.on("read", [this](const Message& m) { handle_read(m); });
        node_.on("counter_state", [this](const Message& m) { handle_state(m); });
        node_.every(Millis(cfg_.anti_entropy_interval_ms), [this] { anti_entropy_tick(); });
    }

    const char* type_name() const override { return "counter"; }

    void add(int64_t delta) { state_.add(node_.id(), delta); }

    int64_t read() const { return state_.value(); }

    bool merge(const GCounter::Entries& snapshot) { return state_.merge(snapshot); }

    void anti_entropy_tick() {
        if (state_.entries().empty()) return;
        const json snapshot = state_.to_json();
        for (const auto& peer : node_.peers()) {
            node_.send(peer, make_body("counter_state", {{"counters", snapshot}}));
        }
    }

    const GCounter& state() const { return state_; }

private:
    void handle_add(const Message& m) {
        const json& delta = m.body.fields.at("delta");
        if (!delta.is_number_integer()) {
            throw RpcError::malformed_request("delta must be an integer, got " + delta.dump());
        }
        if (delta.is_number_unsigned() && delta.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw RpcError::malformed_request("delta " + delta.dump() + " overflows the counter");
        }
        add(delta.get<int64_t>());
        node_.reply(m, make_body("add_ok"));
    }

    void handle_read(const Message& m) {
        node_.reply(m, make_body("read_ok", {{"value", read()}}));
    }

    void handle_state(const Message& m) {
        if (merge(GCounter::parse(m.body.fields.at("counters")))) {
            node_.logger().debug("← counter_state from " + m.src + ": value now " + std::to_string(read()));
        }
    }

    Node& node_;
    CounterConfig cfg_;
    GCounter state_;
};
