#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Line-oriented message channel. Lines carry no terminator.
class Transport {
public:
    virtual ~Transport() = default;

    // Fire-and-forget: never reports delivery failure.
    virtual void send_line(const std::string& line) = 0;

    // Pops the next inbound line if one is queued.
    virtual bool poll_line(std::string& line) = 0;

    // Blocks up to timeout until a line is queued or the input closes.
    virtual void wait(std::chrono::milliseconds timeout) = 0;

    // Input stream closed and every queued line consumed.
    virtual bool closed() const = 0;
};

// stdin/stdout transport. A reader thread accumulates lines into a locked
// queue so the node loop never blocks on input.
class StdioTransport : public Transport {
public:
    StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout)
        : in_(&in), out_(&out), inbox_(std::make_shared<Inbox>()) {}

    ~StdioTransport() override {
        if (!reader_.joinable()) return;
        bool finished;
        {
            std::lock_guard<std::mutex> lock(inbox_->mu);
            finished = inbox_->eof;
        }
        // A reader still blocked on input cannot be interrupted portably. It
        // holds its own reference to the inbox, so it may outlive the transport.
        if (finished) reader_.join();
        else reader_.detach();
    }

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start() {
        std::shared_ptr<Inbox> inbox = inbox_;
        std::istream* in = in_;
        reader_ = std::thread([inbox, in] { read_loop(*in, *inbox); });
    }

    void send_line(const std::string& line) override {
        std::lock_guard<std::mutex> lock(out_mu_);
        *out_ << line << '\n';
        out_->flush();
    }

    bool poll_line(std::string& line) override {
        std::lock_guard<std::mutex> lock(inbox_->mu);
        if (inbox_->lines.empty()) return false;
        line = std::move(inbox_->lines.front());
        inbox_->lines.pop_front();
        return true;
    }

    void wait(std::chrono::milliseconds timeout) override {
        Inbox& box = *inbox_;
        std::unique_lock<std::mutex> lock(box.mu);
        box.cv.wait_for(lock, timeout, [&box] { return !box.lines.empty() || box.eof; });
    }

    bool closed() const override {
        std::lock_guard<std::mutex> lock(inbox_->mu);
        return inbox_->eof && inbox_->lines.empty();
    }

private:
    struct Inbox {
        std::mutex mu;
        std::condition_variable cv;
        std::deque<std::string> lines;
        bool eof = false;
    };

    static void read_loop(std::istream& in, Inbox& box) {
        std::string line;
        while (std::getline(in, line)) {
            {
                std::lock_guard<std::mutex> lock(box.mu);
                box.lines.push_back(std::move(line));
            }
            box.cv.notify_one();
            line.clear();
        }
        {
            std::lock_guard<std::mutex> lock(box.mu);
            box.eof = true;
        }
        box.cv.notify_all();
    }

    std::istream* in_;
    std::ostream* out_;
    std::thread reader_;
    std::shared_ptr<Inbox> inbox_;

    std::mutex out_mu_;
};
