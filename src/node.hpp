#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "config.hpp"
#include "dispatch.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "messages.hpp"
#include "transport.hpp"

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

enum class RpcStatus
{
  Ok,
  ErrorReply,
  DeliveryFailed
};

struct RpcResult
{
  RpcStatus status = RpcStatus::DeliveryFailed;
  std::optional<Message> reply; // empty on DeliveryFailed
  int attempts = 0;

  bool ok() const { return status == RpcStatus::Ok; }

  ErrorCode error_code() const
  {
    if (status == RpcStatus::DeliveryFailed || !reply)
      return ErrorCode::TIMEOUT;
    const json &code = reply->body.fields.value("code", json(static_cast<int>(ErrorCode::CRASH)));
    return code.is_number_integer() ? static_cast<ErrorCode>(code.get<int>()) : ErrorCode::CRASH;
  }

  std::string error_text() const
  {
    if (status == RpcStatus::DeliveryFailed || !reply)
      return "no reply after " + std::to_string(attempts) + " attempts";
    const json &text = reply->body.fields.value("text", json(""));
    return text.is_string() ? text.get<std::string>() : text.dump();
  }
};

using RpcCallback = std::function<void(const RpcResult &)>;

// An outstanding request. Resent verbatim (same msg_id) until a reply with
// matching in_reply_to arrives or the retry ceiling is exceeded.
struct PendingRequest
{
  Message message;
  std::string line;
  TimePoint deadline;
  Millis backoff{0};
  int attempts = 1; // transmissions so far
  RpcCallback callback;
};

class Node
{

public:
  Node(Transport &transport, const NodeConfig &cfg, Logger &logger)
      : transport_(transport),
        cfg_(cfg),
        logger_(logger)
  {
  }

  Node(const Node &) = delete;
  Node &operator=(const Node &) = delete;

  // Identity, valid once the init handshake completed.
  bool initialized() const { return initialized_; }
  const NodeId &id() const { return id_; }
  const std::vector<NodeId> &node_ids() const { return node_ids_; }

  std::vector<NodeId> peers() const
  {
    std::vector<NodeId> out;
    for (const auto &n : node_ids_)
    {
      if (n != id_)
        out.push_back(n);
    }
    return out;
  }

  const NodeConfig &config() const { return cfg_; }
  Logger &logger() { return logger_; }
  TimePoint now() const { return now_; }

  void on(const std::string &type, MessageHandler handler)
  {
    dispatcher_.on(type, std::move(handler));
  }

  // Runs fn every interval from tick_end, starting one interval after init.
  void every(Millis interval, std::function<void()> fn)
  {
    timers_.push_back(Timer{interval, TimePoint{}, false, std::move(fn)});
  }

  // Fire-and-forget. Returns the assigned msg_id.
  MsgId send(const NodeId &dest, Body body)
  {
    Message m{id_, dest, std::move(body)};
    const MsgId msg_id = next_msg_id_++;
    m.body.msg_id = msg_id;
    m.body.in_reply_to.reset();
    transmit(m, encode(m));
    return msg_id;
  }

  void reply(const Message &request, Body body)
  {
    if (!request.body.msg_id)
    {
      logger_.debug("no msg_id on '" + request.body.type + "' from " + request.src + ", reply not sent");
      return;
    }

    Message m{id_, request.src, std::move(body)};
    m.body.msg_id = next_msg_id_++;
    m.body.in_reply_to = *request.body.msg_id;
    transmit(m, encode(m));
    remember_reply(request, m);
  }

  void reply_error(const Message &request, ErrorCode code, const std::string &text)
  {
    reply(request, make_error_body(code, text));
  }

  MsgId request(const NodeId &dest, Body body, RpcCallback callback)
  {
    return request(dest, std::move(body), Millis(cfg_.runtime.rpc_timeout_ms), std::move(callback));
  }

  // The caller continues in callback: with the reply, with an error reply, or
  // with DeliveryFailed once rpc_max_retries resends went unanswered.
  MsgId request(const NodeId &dest, Body body, Millis timeout, RpcCallback callback)
  {
    Message m{id_, dest, std::move(body)};
    const MsgId msg_id = next_msg_id_++;
    m.body.msg_id = msg_id;
    m.body.in_reply_to.reset();

    PendingRequest p;
    p.line = encode(m);
    p.message = m;
    p.backoff = std::max(timeout, Millis(1));
    p.deadline = now_ + p.backoff;
    p.callback = std::move(callback);

    const std::string line = p.line;
    pending_.emplace(msg_id, std::move(p));
    transmit(m, line);
    return msg_id;
  }

  std::size_t pending_count() const { return pending_.size(); }
  bool is_pending(MsgId msg_id) const { return pending_.count(msg_id) != 0; }

  void tick_begin(TimePoint now)
  {
    if (!started_)
    {
      start_ = now;
      started_ = true;
    }
    now_ = now;
    logger_.set_time(std::chrono::duration_cast<Millis>(now_ - start_).count());
  }

  // Drains at most max_recv_per_tick inbound lines. Returns how many.
  int tick_recv()
  {
    int drained = 0;
    std::string line;

    while (drained < cfg_.runtime.max_recv_per_tick && transport_.poll_line(line))
    {
      handle_line(line);
      drained++;
    }
    return drained;
  }

  void tick_end()
  {
    check_pending();
    run_timers();
  }

  // Runs until the input stream closes. FatalError propagates.
  void run()
  {
    while (!transport_.closed())
    {
      tick_begin(Clock::now());
      const int drained = tick_recv();
      tick_end();

      if (drained == 0)
        transport_.wait(Millis(cfg_.runtime.idle_wait_ms));
    }
    logger_.debug("input closed with " + std::to_string(pending_.size()) + " requests outstanding");
  }

  void handle_line(const std::string &line)
  {
    if (line.find_first_not_of(" \t\r") == std::string::npos)
      return;

    Message m;
    try
    {
      m = decode(line);
    }
    catch (const DecodeError &e)
    {
      if (!initialized_)
        throw FatalError(std::string("corrupt handshake: ") + e.what());
      logger_.warn(std::string("dropping malformed line: ") + e.what());
      return;
    }
    handle_message(m);
  }

private:
  struct Timer
  {
    Millis interval;
    TimePoint next_due;
    bool armed;
    std::function<void()> fn;
  };

  using ReplyKey = std::pair<NodeId, MsgId>;

  // Transport
  Transport &transport_;
  NodeConfig cfg_;
  Logger &logger_;

  // Identity
  bool initialized_ = false;
  NodeId id_;
  std::vector<NodeId> node_ids_;

  // Clock
  bool started_ = false;
  TimePoint start_{};
  TimePoint now_{};

  MsgId next_msg_id_ = 1;
  Dispatcher dispatcher_;
  std::map<MsgId, PendingRequest> pending_;
  std::vector<Timer> timers_;

  std::map<ReplyKey, Message> reply_cache_;
  std::deque<ReplyKey> reply_order_;

  void transmit(const Message &m, const std::string &line)
  {
    logger_.log_send(m);
    transport_.send_line(line);
  }

  void handle_message(const Message &m)
  {
    logger_.log_recv(m);

    if (m.body.type == "init")
    {
      handle_init(m);
      return;
    }
    if (!initialized_)
      throw FatalError("expected init before '" + m.body.type + "' from " + m.src);

    if (m.body.is_reply())
    {
      if (resolve_reply(m))
        return;
      if (!dispatcher_.handles(m.body.type))
      {
        logger_.debug("← " + m.body.type + " from " + m.src + " in reply to " +
                      std::to_string(*m.body.in_reply_to) + ": no pending request, dropped");
        return;
      }
    }
    else if (m.body.msg_id && !is_member(m.src))
    {
      auto cached = reply_cache_.find(ReplyKey{m.src, *m.body.msg_id});
      if (cached != reply_cache_.end())
      {
        logger_.debug("← duplicate " + m.body.type + " " + std::to_string(*m.body.msg_id) +
                      " from " + m.src + ": re-sending cached reply");
        transmit(cached->second, encode(cached->second));
        return;
      }
    }

    dispatch(m);
  }

  void dispatch(const Message &m)
  {
    try
    {
      dispatcher_.dispatch(m);
    }
    catch (const FatalError &)
    {
      throw;
    }
    catch (const RpcError &e)
    {
      fail_request(m, e.code(), e.what());
    }
    catch (const json::exception &e)
    {
      fail_request(m, ErrorCode::MALFORMED_REQUEST, e.what());
    }
    catch (const std::exception &e)
    {
      logger_.error("handler for '" + m.body.type + "' failed: " + e.what());
      fail_request(m, ErrorCode::CRASH, e.what());
    }
  }

  void fail_request(const Message &m, ErrorCode code, const std::string &text)
  {
    if (m.body.msg_id && !m.body.is_reply())
    {
      logger_.debug("→ error " + std::string(error_code_to_string(code)) + " to " + m.src + ": " + text);
      reply_error(m, code, text);
    }
    else
    {
      logger_.warn("dropping '" + m.body.type + "' from " + m.src + ": " + text);
    }
  }

  void handle_init(const Message &m)
  {
    if (initialized_)
    {
      logger_.warn("duplicate init from " + m.src + ", identity unchanged");
      reply(m, make_body("init_ok"));
      return;
    }

    const json &f = m.body.fields;
    auto node_id = f.find("node_id");
    auto node_ids = f.find("node_ids");
    if (node_id == f.end() || !node_id->is_string() || node_id->get<std::string>().empty())
      throw FatalError("init without node_id");
    if (node_ids == f.end() || !node_ids->is_array())
      throw FatalError("init without node_ids");

    std::vector<NodeId> ids;
    for (const auto &n : *node_ids)
    {
      if (!n.is_string())
        throw FatalError("init node_ids contains a non-string entry");
      ids.push_back(n.get<std::string>());
    }

    id_ = node_id->get<std::string>();
    node_ids_ = std::move(ids);
    initialized_ = true;
    logger_.set_node(id_);
    logger_.debug("initialized, cluster of " + std::to_string(node_ids_.size()) + " nodes");

    reply(m, make_body("init_ok"));
  }

  bool resolve_reply(const Message &m)
  {
    auto it = pending_.find(*m.body.in_reply_to);
    if (it == pending_.end() || it->second.message.dest != m.src)
      return false;

    RpcResult result;
    result.status = m.body.is_error() ? RpcStatus::ErrorReply : RpcStatus::Ok;
    result.reply = m;
    result.attempts = it->second.attempts;

    RpcCallback callback = std::move(it->second.callback);
    pending_.erase(it);
    invoke("reply callback", [&] {
      if (callback)
        callback(result);
    });
    return true;
  }

  void check_pending()
  {
    std::vector<MsgId> expired;
    for (const auto &kv : pending_)
    {
      if (now_ >= kv.second.deadline)
        expired.push_back(kv.first);
    }

    for (MsgId msg_id : expired)
    {
      auto it = pending_.find(msg_id);
      if (it == pending_.end())
        continue;
      PendingRequest &p = it->second;

      if (p.attempts - 1 >= cfg_.runtime.rpc_max_retries)
      {
        logger_.debug("✗ " + p.message.body.type + " " + std::to_string(msg_id) + " to " +
                      p.message.dest + ": no reply after " + std::to_string(p.attempts) + " attempts");
        RpcResult result;
        result.status = RpcStatus::DeliveryFailed;
        result.attempts = p.attempts;
        RpcCallback callback = std::move(p.callback);
        pending_.erase(it);
        invoke("delivery failure callback", [&] {
          if (callback)
            callback(result);
        });
        continue;
      }

      p.attempts++;
      p.backoff = std::min(p.backoff * 2, Millis(cfg_.runtime.rpc_max_backoff_ms));
      p.deadline = now_ + p.backoff;
      logger_.debug("↻ " + p.message.body.type + " " + std::to_string(msg_id) + " to " +
                    p.message.dest + " (attempt " + std::to_string(p.attempts) + ")");
      transmit(p.message, p.line);
    }
  }

  void run_timers()
  {
    if (!initialized_)
      return;

    for (std::size_t i = 0; i < timers_.size(); ++i)
    {
      if (!timers_[i].armed)
      {
        timers_[i].armed = true;
        timers_[i].next_due = now_ + timers_[i].interval;
        continue;
      }
      if (now_ < timers_[i].next_due)
        continue;

      timers_[i].next_due = now_ + timers_[i].interval;
      std::function<void()> fn = timers_[i].fn;
      invoke("timer", fn);
    }
  }

  // Callbacks and timers run outside any request; their failures are logged.
  template <typename F>
  void invoke(const char *what, F &&fn)
  {
    try
    {
      fn();
    }
    catch (const FatalError &)
    {
      throw;
    }
    catch (const std::exception &e)
    {
      logger_.error(std::string(what) + " failed: " + e.what());
    }
  }

  bool is_member(const NodeId &n) const
  {
    return std::find(node_ids_.begin(), node_ids_.end(), n) != node_ids_.end();
  }

  // Only client requests are cached. A restarted peer reuses msg_ids from 1,
  // so a (peer, msg_id) pair does not identify one request across its lifetimes.
  void remember_reply(const Message &request, const Message &reply)
  {
    if (cfg_.runtime.reply_cache_size <= 0 || is_member(request.src))
      return;

    ReplyKey key{request.src, *request.body.msg_id};
    if (reply_cache_.emplace(key, reply).second)
      reply_order_.push_back(key);

    while (reply_order_.size() > static_cast<std::size_t>(cfg_.runtime.reply_cache_size))
    {
      reply_cache_.erase(reply_order_.front());
      reply_order_.pop_front();
    }
  }
};
