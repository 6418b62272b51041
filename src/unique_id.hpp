#pragma once
#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>
#include "messages.hpp"
#include "node.hpp"
#include "workload.hpp"

inline uint64_t unix_millis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

// Ids look like "<node>-<start ms hex>-<seq hex>". The two hex parts never
// contain '-', so splitting from the right recovers the node name: ids from
// different nodes cannot collide, and one process never repeats a sequence.
// The start time separates a restarted process from its previous life.
class IdGenerator {
public:
    explicit IdGenerator(uint64_t start_ms = unix_millis()) : start_ms_(start_ms) {}

    std::string next(const NodeId& node) {
        std::ostringstream oss;
        oss << node << '-' << std::hex << start_ms_ << '-' << seq_++;
        return oss.str();
    }

    uint64_t issued() const { return seq_; }

private:
    uint64_t start_ms_;
    uint64_t seq_ = 0;
};

class UniqueIdWorkload : public Workload {
public:
    explicit UniqueIdWorkload(Node& node, uint64_t start_ms = unix_millis())
        : node_(node), generator_(start_ms) {
        node_.on("generate", [this](const Message& m) { handle_generate(m); });
    }

    const char* type_name() const override { return "unique-ids"; }

    const IdGenerator& generator() const { return generator_; }

private:
    // Retried requests (same msg_id) are answered from the node's reply
    // cache and never reach this handler twice.
    void handle_generate(const Message& m) {
        node_.reply(m, make_body("generate_ok", {{"id", generator_.next(node_.id())}}));
    }

    Node& node_;
    IdGenerator generator_;
};
