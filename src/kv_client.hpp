#pragma once
#include <functional>
#include <string>
#include <utility>
#include "errors.hpp"
#include "messages.hpp"
#include "node.hpp"

// Outcome of a KV call. value holds read_ok's value; code is meaningful when
// !ok (KEY_DOES_NOT_EXIST, PRECONDITION_FAILED, TIMEOUT on delivery failure, ...).
struct KvResult {
    bool ok = false;
    ErrorCode code = ErrorCode::TIMEOUT;
    std::string text;
    json value;
};

using KvCallback = std::function<void(const KvResult&)>;

// Client for the harness's key/value services ("seq-kv", "lin-kv", "lww-kv").
class KvClient {
public:
    explicit KvClient(Node& node, std::string service = "seq-kv")
        : node_(node), service_(std::move(service)) {}

    const std::string& service() const { return service_; }

    void read(const json& key, KvCallback callback) {
        call(make_body("read", {{"key", key}}), "read_ok", std::move(callback));
    }

    void write(const json& key, const json& value, KvCallback callback) {
        call(make_body("write", {{"key", key}, {"value", value}}), "write_ok", std::move(callback));
    }

    void cas(const json& key, const json& from, const json& to, bool create_if_not_exists,
             KvCallback callback) {
        call(make_body("cas", {{"key", key},
                               {"from", from},
                               {"to", to},
                               {"create_if_not_exists", create_if_not_exists}}),
             "cas_ok", std::move(callback));
    }

private:
    void call(Body body, std::string expected, KvCallback callback) {
        node_.request(service_, std::move(body),
                      [expected, callback](const RpcResult& r) {
                          KvResult out;
                          if (r.ok() && r.reply->body.type == expected) {
                              out.ok = true;
                              out.value = r.reply->body.fields.value("value", json());
                          } else if (r.ok()) {
                              out.code = ErrorCode::MALFORMED_REQUEST;
                              out.text = "unexpected reply '" + r.reply->body.type + "', wanted '" + expected + "'";
                          } else {
                              out.code = r.error_code();
                              out.text = r.error_text();
                          }
                          if (callback) callback(out);
                      });
    }

    Node& node_;
    std::string service_;
};
