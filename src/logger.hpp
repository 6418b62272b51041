#pragma once
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
#include "messages.hpp"

using json = nlohmann::json;

// Diagnostics go to stderr (stdout is the protocol channel). Optionally every
// message sent or received is traced to a JSON Lines file for offline analysis.
class Logger {
public:
    explicit Logger(std::ostream& diag = std::cerr) : diag_(&diag) {}

    bool open_message_log(const std::string& path) {
        if (path.empty()) return false;
        msg_file_.open(path, std::ios::out | std::ios::app);
        return msg_file_.is_open();
    }

    void close() {
        if (msg_file_.is_open()) msg_file_.close();
    }

    void set_verbose(bool verbose) { verbose_ = verbose; }

    void set_node(const std::string& node_id) { node_ = node_id; }

    // Milliseconds since the node started; stamped on every line.
    void set_time(int64_t t_ms) { t_ms_ = t_ms; }

    void debug(const std::string& msg) {
        if (!verbose_) return;
        write("", msg);
    }

    void warn(const std::string& msg) { write("WARN ", msg); }

    void error(const std::string& msg) { write("ERROR ", msg); }

    // Format: {"t":412,"dir":"send","type":"gossip","src":"n1","dst":"n2","msg_id":7}\n
    void log_send(const Message& m) { log_message("send", m); }

    void log_recv(const Message& m) { log_message("recv", m); }

private:
    void write(const char* level, const std::string& msg) {
        std::ostringstream oss;
        oss << "[" << (node_.empty() ? "?" : node_) << "][t=" << t_ms_ << "] "
            << level << msg << "\n";
        *diag_ << oss.str();
        diag_->flush();
    }

    void log_message(const char* dir, const Message& m) {
        if (!msg_file_.is_open()) return;

        json j = {
            {"t", t_ms_},
            {"dir", dir},
            {"type", m.body.type},
            {"src", m.src},
            {"dst", m.dest}
        };
        if (m.body.msg_id) j["msg_id"] = *m.body.msg_id;
        if (m.body.in_reply_to) j["in_reply_to"] = *m.body.in_reply_to;

        msg_file_ << j.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
        msg_file_.flush();
    }

    std::ostream* diag_;
    std::ofstream msg_file_;
    std::string node_;
    int64_t t_ms_ = 0;
    bool verbose_ = false;
};
