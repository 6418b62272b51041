#pragma once
#include <functional>
#include <map>
#include <string>
#include "errors.hpp"
#include "messages.hpp"

using MessageHandler = std::function<void(const Message&)>;

// Routes inbound messages to workload handlers by body type.
class Dispatcher {
public:
    // Registering a type twice replaces the earlier handler.
    void on(const std::string& type, MessageHandler handler) {
        handlers_[type] = std::move(handler);
    }

    bool handles(const std::string& type) const {
        return handlers_.count(type) != 0;
    }

    // Throws RpcError(NOT_SUPPORTED) for an unknown type. Handler exceptions
    // propagate to the caller.
    void dispatch(const Message& m) const {
        auto it = handlers_.find(m.body.type);
        if (it == handlers_.end()) {
            throw RpcError::not_supported("unsupported message type '" + m.body.type + "'");
        }
        it->second(m);
    }

private:
    std::map<std::string, MessageHandler> handlers_;
};
