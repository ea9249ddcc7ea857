#pragma once

#include "clock.h"
#include "executor.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kestrel {

struct InboundMessage {
    std::string id;
    std::string chat_jid;
    std::string sender;
    std::string sender_name;
    std::string text;
    int64_t timestamp_ms{0};
    bool from_me{false};
};

using InboundFn = std::function<void(const InboundMessage&)>;

// A transport adapter. Adapters normalize their native addressing into
// "<channel>:<id>" jids before calling the inbound handler.
class Channel {
public:
    virtual ~Channel() = default;

    virtual std::string name() const = 0;
    virtual bool owns_jid(const std::string& jid) const = 0;

    // Returns empty string on success; an error is treated as transient.
    virtual std::string send_message(const std::string& jid, const std::string& text) = 0;

    virtual std::string connect(InboundFn on_message) = 0;
    virtual void disconnect() = 0;
};

// Routes outbound text by jid. Failed sends are retried on the clock with
// exponential backoff; send() itself never blocks on a retry.
class ChannelRouter {
public:
    explicit ChannelRouter(Clock& clock, int max_attempts = 4, int64_t base_delay_ms = 1000);
    ~ChannelRouter();

    ChannelRouter(const ChannelRouter&) = delete;
    ChannelRouter& operator=(const ChannelRouter&) = delete;

    void add(std::shared_ptr<Channel> ch);
    std::shared_ptr<Channel> find(const std::string& jid) const;

    // False if no channel owns the jid.
    bool send(const std::string& jid, const std::string& text);

    std::string connect_all(InboundFn on_message);
    // Cancels pending retries and disconnects every channel. Idempotent.
    void disconnect_all();

private:
    void attempt(std::shared_ptr<Channel> ch, std::string jid, std::string text, int n);

    Clock& clock_;
    int max_attempts_;
    int64_t base_delay_ms_;
    mutable std::mutex mu_;
    std::vector<std::shared_ptr<Channel>> channels_;
    std::vector<TimerId> retries_;
    bool closed_{false};
};

// File-spool channel: inbound messages are JSON files dropped into
// <root>/inbox, outbound messages are written to <root>/outbox.
// jids look like "spool:<chat>".
class SpoolChannel : public Channel {
public:
    // With an executor, inbox polls run on it instead of the timer thread.
    SpoolChannel(std::filesystem::path root, Clock& clock, int64_t poll_ms = 1000,
                 Executor* exec = nullptr);
    ~SpoolChannel() override;

    std::string name() const override { return "spool"; }
    bool owns_jid(const std::string& jid) const override;
    std::string send_message(const std::string& jid, const std::string& text) override;
    std::string connect(InboundFn on_message) override;
    void disconnect() override;

    // Reads and removes every inbox file. Returns messages delivered.
    size_t poll_once();

    const std::filesystem::path& root() const { return root_; }

private:
    void arm();

    std::filesystem::path root_;
    Clock& clock_;
    int64_t poll_ms_;
    Executor* exec_;
    std::mutex mu_;
    InboundFn on_message_;
    TimerId timer_{0};
    bool connected_{false};
};

} // namespace kestrel
