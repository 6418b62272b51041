#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "errors.hpp"

using json = nlohmann::json;

using NodeId = std::string;
using MsgId = uint64_t;

// Message body: type tag, optional ids, and the type-specific fields.
// fields is always a JSON object and never holds the three reserved keys.
struct Body {
    std::string type;
    std::optional<MsgId> msg_id;
    std::optional<MsgId> in_reply_to;
    json fields = json::object();

    bool is_reply() const { return in_reply_to.has_value(); }
    bool is_error() const { return type == "error"; }

    bool operator==(const Body& other) const {
        return type == other.type && msg_id == other.msg_id &&
               in_reply_to == other.in_reply_to && fields == other.fields;
    }
    bool operator!=(const Body& other) const { return !(*this == other); }
};

struct Message {
    NodeId src;
    NodeId dest;
    Body body;

    bool operator==(const Message& other) const {
        return src == other.src && dest == other.dest && body == other.body;
    }
    bool operator!=(const Message& other) const { return !(*this == other); }
};

inline Body make_body(std::string type, json fields = json::object()) {
    Body b;
    b.type = std::move(type);
    if (fields.is_object()) {
        fields.erase("type");
        fields.erase("msg_id");
        fields.erase("in_reply_to");
        b.fields = std::move(fields);
    }
    return b;
}

inline Body make_error_body(ErrorCode code, const std::string& text) {
    return make_body("error", {{"code", static_cast<int>(code)}, {"text", text}});
}

inline json to_json(const Message& m) {
    json body = json::object();
    for (const auto& el : m.body.fields.items()) {
        body[el.key()] = el.value();
    }
    body["type"] = m.body.type;
    if (m.body.msg_id) body["msg_id"] = *m.body.msg_id;
    if (m.body.in_reply_to) body["in_reply_to"] = *m.body.in_reply_to;

    return json{{"src", m.src}, {"dest", m.dest}, {"body", std::move(body)}};
}

// One line, no terminator. Invalid UTF-8 in strings is replaced, never thrown.
inline std::string encode(const Message& m) {
    return to_json(m).dump(-1, ' ', false, json::error_handler_t::replace);
}

namespace detail {

inline std::string require_string(const json& obj, const char* key, const char* where) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        throw DecodeError(std::string("missing or non-string field '") + where + key + "'");
    }
    return it->get<std::string>();
}

inline std::optional<MsgId> optional_id(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) return std::nullopt;
    if (it->is_number_unsigned()) return it->get<MsgId>();
    if (it->is_number_integer() && it->get<int64_t>() >= 0) {
        return static_cast<MsgId>(it->get<int64_t>());
    }
    throw DecodeError(std::string("field 'body.") + key + "' is not a non-negative integer");
}

} // namespace detail

// Throws DecodeError on anything that is not a well-formed envelope.
inline Message decode(const std::string& line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error& e) {
        throw DecodeError(std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw DecodeError("message is not a JSON object");
    }

    Message m;
    m.src = detail::require_string(j, "src", "");
    m.dest = detail::require_string(j, "dest", "");

    auto body_it = j.find("body");
    if (body_it == j.end() || !body_it->is_object()) {
        throw DecodeError("missing or non-object field 'body'");
    }
    const json& body = *body_it;

    m.body.type = detail::require_string(body, "type", "body.");
    m.body.msg_id = detail::optional_id(body, "msg_id");
    m.body.in_reply_to = detail::optional_id(body, "in_reply_to");

    for (const auto& el : body.items()) {
        const std::string& key = el.key();
        if (key == "type" || key == "msg_id" || key == "in_reply_to") continue;
        m.body.fields[key] = el.value();
    }
    return m;
}
