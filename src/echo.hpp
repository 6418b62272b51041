#pragma once
#include "messages.hpp"
#include "node.hpp"
#include "workload.hpp"

class EchoWorkload : public Workload {
public:
    explicit EchoWorkload(Node& node) : node_(node) {
        node_.on("echo", [this](const Message& m) { handle_echo(m); });
    }

    const char* type_name() const override { return "echo"; }

private:
    void handle_echo(const Message& m) {
        node_.reply(m, make_body("echo_ok", {{"echo", m.body.fields.at("echo")}}));
    }

    Node& node_;
};
