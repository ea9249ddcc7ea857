#include "kestrel/channel.h"
#include "kestrel/fsutil.h"
#include "kestrel/json_util.h"
#include "kestrel/log.h"

#include <algorithm>

namespace kestrel {

// ---------- ChannelRouter ----------

ChannelRouter::ChannelRouter(Clock& clock, int max_attempts, int64_t base_delay_ms)
    : clock_(clock), max_attempts_(std::max(1, max_attempts)), base_delay_ms_(base_delay_ms) {}

ChannelRouter::~ChannelRouter() { disconnect_all(); }

void ChannelRouter::add(std::shared_ptr<Channel> ch) {
    std::lock_guard<std::mutex> lk(mu_);
    channels_.push_back(std::move(ch));
}

std::shared_ptr<Channel> ChannelRouter::find(const std::string& jid) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& ch : channels_) {
        if (ch->owns_jid(jid)) return ch;
    }
    return nullptr;
}

bool ChannelRouter::send(const std::string& jid, const std::string& text) {
    auto ch = find(jid);
    if (!ch) {
        log_warn("channel", "no channel owns " + jid + ", dropping outbound message");
        return false;
    }
    attempt(std::move(ch), jid, text, 1);
    return true;
}

void ChannelRouter::attempt(std::shared_ptr<Channel> ch, std::string jid, std::string text, int n) {
    std::string err = ch->send_message(jid, text);
    if (err.empty()) return;

    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return;
    if (n >= max_attempts_) {
        log_error("channel", ch->name() + ": giving up on " + jid + " after " + std::to_string(n) + " attempts: " + err);
        return;
    }
    int64_t delay = backoff_delay_ms(n, base_delay_ms_, 2, 60000, base_delay_ms_ / 4);
    log_warn("channel", ch->name() + ": send to " + jid + " failed (" + err + "), retry in " + std::to_string(delay) + "ms");
    TimerId id = clock_.schedule_after(delay, [this, ch, jid, text, n]() {
        attempt(ch, jid, text, n + 1);
    });
    retries_.push_back(id);
}

std::string ChannelRouter::connect_all(InboundFn on_message) {
    std::vector<std::shared_ptr<Channel>> chans;
    {
        std::lock_guard<std::mutex> lk(mu_);
        chans = channels_;
    }
    for (auto& ch : chans) {
        std::string err = ch->connect(on_message);
        if (!err.empty()) return ch->name() + ": " + err;
        log_info("channel", ch->name() + " connected");
    }
    return "";
}

void ChannelRouter::disconnect_all() {
    std::vector<std::shared_ptr<Channel>> chans;
    std::vector<TimerId> retries;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return;
        closed_ = true;
        chans = channels_;
        retries.swap(retries_);
    }
    for (TimerId id : retries) clock_.cancel(id);
    for (auto& ch : chans) ch->disconnect();
}

// ---------- SpoolChannel ----------

static const char* kSpoolPrefix = "spool:";

SpoolChannel::SpoolChannel(std::filesystem::path root, Clock& clock, int64_t poll_ms, Executor* exec)
    : root_(std::move(root)), clock_(clock), poll_ms_(std::max<int64_t>(10, poll_ms)), exec_(exec) {}

SpoolChannel::~SpoolChannel() { disconnect(); }

bool SpoolChannel::owns_jid(const std::string& jid) const {
    return jid.rfind(kSpoolPrefix, 0) == 0;
}

std::string SpoolChannel::send_message(const std::string& jid, const std::string& text) {
    int64_t now = clock_.now_ms();
    json::ObjectBuilder b;
    b.set("chatJid", jid).set("text", text).set("timestamp", now);
    return write_atomic(root_ / "outbox" / (unique_stem(now) + ".json"), b.str() + "\n");
}

std::string SpoolChannel::connect(InboundFn on_message) {
    std::error_code ec;
    for (const char* sub : {"inbox", "outbox", "errors"}) {
        std::filesystem::create_directories(root_ / sub, ec);
        if (ec) return "create " + (root_ / sub).string() + ": " + ec.message();
    }
    std::lock_guard<std::mutex> lk(mu_);
    on_message_ = std::move(on_message);
    connected_ = true;
    arm();
    return "";
}

void SpoolChannel::disconnect() {
    std::lock_guard<std::mutex> lk(mu_);
    if (!connected_) return;
    connected_ = false;
    if (timer_) clock_.cancel(timer_);
    timer_ = 0;
}

void SpoolChannel::arm() {
    timer_ = clock_.schedule_after(poll_ms_, [this]() {
        auto run = [this]() {
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (!connected_) return;
            }
            (void)poll_once();
            std::lock_guard<std::mutex> lk(mu_);
            if (connected_) arm();
        };
        if (exec_) {
            if (!exec_->submit(PRIO_MESSAGE, run)) log_warn("spool", "executor closed, polling stops");
        } else {
            run();
        }
    });
}

size_t SpoolChannel::poll_once() {
    InboundFn fn;
    {
        std::lock_guard<std::mutex> lk(mu_);
        fn = on_message_;
    }
    size_t n = 0;
    for (const auto& p : list_dir_json(root_ / "inbox")) {
        auto body = slurp_file(p);
        std::error_code ec;
        json::Doc d = body ? json::parse(*body) : json::Doc{};
        if (!d.is_object()) {
            log_warn("spool", "unparseable inbox file " + p.filename().string() + ", moving to errors");
            std::filesystem::rename(p, root_ / "errors" / p.filename(), ec);
            if (ec) std::filesystem::remove(p, ec);
            continue;
        }
        InboundMessage m;
        m.id = p.stem().string();
        m.chat_jid = json::get_string(d.root, "chatJid").value_or("");
        if (m.chat_jid.empty()) {
            auto chat = json::get_string(d.root, "chat").value_or("");
            if (!chat.empty()) m.chat_jid = kSpoolPrefix + chat;
        }
        m.sender = json::get_string(d.root, "sender").value_or("");
        m.sender_name = json::get_string(d.root, "senderName").value_or(m.sender);
        m.text = json::get_string(d.root, "text").value_or("");
        m.timestamp_ms = json::get_int(d.root, "timestamp").value_or(clock_.now_ms());
        std::filesystem::remove(p, ec);
        if (!owns_jid(m.chat_jid) || m.text.empty()) {
            log_warn("spool", "inbox file " + p.filename().string() + " has no usable chat or text");
            continue;
        }
        if (fn) fn(m);
        n++;
    }
    return n;
}

} // namespace kestrel
