#pragma once
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include "errors.hpp"
#include "kv_client.hpp"
#include "messages.hpp"
#include "node.hpp"
#include "workload.hpp"

// Counter kept in one key of the sequential KV service. add is a
// read-then-cas loop: a lost race (precondition failed) re-reads and retries,
// a missing key counts as zero and is created by the cas.
class KvCounter : public Workload {
public:
    static constexpr const char* kKey = "counter";

    explicit KvCounter(Node& node, std::string service = "seq-kv")
        : node_(node), kv_(node, std::move(service)) {
        node_.on("add", [this](const Message& m) { handle_add(m); });
        node_.on("read", [this](const Message& m) { handle_read(m); });
    }

    const char* type_name() const override { return "seq-kv-counter"; }

    int cas_conflicts() const { return cas_conflicts_; }

private:
    void handle_add(const Message& m) {
        const json& delta = m.body.fields.at("delta");
        if (!delta.is_number_integer() ||
            (delta.is_number_unsigned() && delta.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))) {
            throw RpcError::malformed_request("delta must be a 64-bit integer, got " + delta.dump());
        }
        if (delta.get<int64_t>() < 0) {
            throw RpcError::malformed_request("delta must be non-negative, got " + delta.dump());
        }
        try_add(m, delta.get<int64_t>());
    }

    void try_add(const Message& request, int64_t delta) {
        kv_.read(kKey, [this, request, delta](const KvResult& r) {
            int64_t current = 0;
            if (r.ok) {
                if (!r.value.is_number_integer()) {
                    fail(request, ErrorCode::CRASH, "counter holds " + r.value.dump());
                    return;
                }
                current = r.value.get<int64_t>();
                if (delta > std::numeric_limits<int64_t>::max() - current) {
                    fail(request, ErrorCode::MALFORMED_REQUEST, "delta " + std::to_string(delta) + " overflows the counter");
                    return;
                }
            } else if (r.code != ErrorCode::KEY_DOES_NOT_EXIST) {
                fail(request, r.code, r.text);
                return;
            }

            kv_.cas(kKey, current, current + delta, true, [this, request, delta](const KvResult& c) {
                if (c.ok) {
                    node_.reply(request, make_body("add_ok"));
                } else if (c.code == ErrorCode::PRECONDITION_FAILED) {
                    cas_conflicts_++;
                    try_add(request, delta);
                } else {
                    fail(request, c.code, c.text);
                }
            });
        });
    }

    void handle_read(const Message& m) {
        kv_.read(kKey, [this, m](const KvResult& r) {
            if (r.ok && r.value.is_number_integer()) {
                node_.reply(m, make_body("read_ok", {{"value", r.value}}));
            } else if (!r.ok && r.code == ErrorCode::KEY_DOES_NOT_EXIST) {
                node_.reply(m, make_body("read_ok", {{"value", 0}}));
            } else if (r.ok) {
                fail(m, ErrorCode::CRASH, "counter holds " + r.value.dump());
            } else {
                fail(m, r.code, r.text);
            }
        });
    }

    void fail(const Message& request, ErrorCode code, const std::string& text) {
        node_.logger().warn(request.body.type + " from " + request.src + " failed: " + text);
        node_.reply_error(request, code, text);
    }

    Node& node_;
    KvClient kv_;
    int cas_conflicts_ = 0;
};
