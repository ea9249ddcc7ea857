#include "test_common.h"
#include "fake_process.h"

#include "kestrel/channel.h"
#include "kestrel/fsutil.h"
#include "kestrel/group_queue.h"
#include "kestrel/inbound.h"
#include "kestrel/json_util.h"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

using namespace kestrel;
namespace fs = std::filesystem;

static void test_trigger() {
    expect_true(has_trigger("@Kestrel hello", "Kestrel"), "leading mention");
    expect_true(has_trigger("  @kestrel, what's up", "Kestrel"), "case-insensitive after whitespace");
    expect_true(has_trigger("@KESTREL", "Kestrel"), "mention alone");
    expect_true(!has_trigger("hey @Kestrel", "Kestrel"), "mention must lead");
    expect_true(!has_trigger("@Kestrels unite", "Kestrel"), "word boundary");
    expect_true(!has_trigger("@Kestrel_bot hi", "Kestrel"), "underscore continues the word");
    expect_true(!has_trigger("@Kes", "Kestrel"), "truncated name");
    expect_true(!has_trigger("@Kestrel hi", ""), "no name, no trigger");
}

// Fails the first `failures` sends.
class FlakyChannel : public Channel {
public:
    explicit FlakyChannel(int failures) : failures_(failures) {}

    std::string name() const override { return "flaky"; }
    bool owns_jid(const std::string& jid) const override { return jid.rfind("flaky:", 0) == 0; }
    std::string send_message(const std::string& jid, const std::string& text) override {
        attempts++;
        if (failures_ > 0) {
            failures_--;
            return "transport down";
        }
        delivered.push_back(jid + "|" + text);
        return "";
    }
    std::string connect(InboundFn) override { return ""; }
    void disconnect() override { disconnected = true; }

    int attempts{0};
    bool disconnected{false};
    std::vector<std::string> delivered;

private:
    int failures_;
};

static void test_channel_router() {
    ManualClock clock(0);
    ChannelRouter router(clock, 3, 1000);
    auto flaky = std::make_shared<FlakyChannel>(2);
    router.add(flaky);

    expect_true(!router.send("spool:nobody", "x"), "no owner for the jid");
    expect_true(router.find("flaky:1") == flaky, "owner found by prefix");

    expect_true(router.send("flaky:1", "hello"), "send accepted");
    expect_eq_ll(flaky->attempts, 1, "first attempt inline");
    clock.advance(999);
    expect_eq_ll(flaky->attempts, 1, "no retry before the base delay");
    clock.advance(251);
    expect_eq_ll(flaky->attempts, 2, "second attempt after base delay plus jitter");
    clock.advance(2250);
    expect_eq_ll(flaky->attempts, 3, "third attempt after a doubled delay");
    expect_eq_ll((long long)flaky->delivered.size(), 1, "delivered on the third try");
    expect_eq_ll((long long)clock.pending(), 0, "no retry left");

    auto dead = std::make_shared<FlakyChannel>(100);
    ManualClock clock2(0);
    ChannelRouter router2(clock2, 2, 1000);
    router2.add(dead);
    expect_true(router2.send("flaky:2", "lost"), "accepted");
    clock2.advance(60000);
    expect_eq_ll(dead->attempts, 2, "gives up after max attempts");
    expect_eq_ll((long long)clock2.pending(), 0, "no timer after giving up");

    // Disconnect cancels pending retries.
    auto later = std::make_shared<FlakyChannel>(1);
    ManualClock clock3(0);
    ChannelRouter router3(clock3, 4, 1000);
    router3.add(later);
    (void)router3.send("flaky:3", "never");
    expect_eq_ll((long long)clock3.pending(), 1, "retry armed");
    router3.disconnect_all();
    expect_true(later->disconnected, "channel disconnected");
    expect_eq_ll((long long)clock3.pending(), 0, "retry cancelled");
    router3.disconnect_all();
}

static void test_spool_channel() {
    fs::path dir = fresh_dir("inbound_spool");
    ManualClock clock(5000);
    SpoolChannel spool(dir, clock, 250);
    std::vector<InboundMessage> got;
    expect_true(spool.connect([&](const InboundMessage& m) { got.push_back(m); }).empty(), "connect");
    expect_true(fs::is_directory(dir / "outbox"), "outbox created");

    write_text(dir / "inbox" / "a.json", "{\"chat\":\"fam\",\"sender\":\"spool:bob\",\"text\":\"hi\"}");
    write_text(dir / "inbox" / "b.json", "{\"chatJid\":\"other:fam\",\"text\":\"foreign\"}");
    write_text(dir / "inbox" / "c.json", "{\"chatJid\":\"spool:fam\",\"text\":");
    write_text(dir / "inbox" / "d.json", "{\"chatJid\":\"spool:fam\",\"text\":\"\"}");
    clock.advance(250);
    expect_eq_ll((long long)got.size(), 1, "only the usable message delivered");
    expect_eq_str(got[0].chat_jid, "spool:fam", "bare chat gets the channel prefix");
    expect_eq_str(got[0].sender_name, "spool:bob", "sender name defaults to the sender");
    expect_eq_ll(got[0].timestamp_ms, 5250, "missing timestamp uses the clock");
    expect_eq_str(got[0].id, "a", "id from the file name");
    expect_eq_ll((long long)list_dir_json(dir / "inbox").size(), 0, "inbox emptied");
    expect_true(fs::exists(dir / "errors" / "c.json"), "unparseable file kept for inspection");

    expect_true(spool.owns_jid("spool:x") && !spool.owns_jid("mail:x"), "jid ownership");
    expect_true(spool.send_message("spool:fam", "reply").empty(), "send");
    auto out = list_dir_json(dir / "outbox");
    expect_eq_ll((long long)out.size(), 1, "outbox file");
    json::Doc d = json::parse(*slurp_file(out[0]));
    expect_eq_str(json::get_string(d.root, "text").value_or(""), "reply", "outbox text");
    expect_eq_ll(json::get_int(d.root, "timestamp").value_or(0), 5250, "outbox timestamp");

    spool.disconnect();
    write_text(dir / "inbox" / "e.json", "{\"chat\":\"fam\",\"text\":\"late\"}");
    clock.advance(1000);
    expect_eq_ll((long long)got.size(), 1, "no polling after disconnect");
}

// Inbox polls run on the executor; the timer thread stays free while a
// message is being handled.
static void test_spool_channel_on_executor() {
    fs::path dir = fresh_dir("inbound_spool_pool");
    std::mutex mu;
    std::condition_variable cv;
    bool timer_fired = false;
    bool timer_seen_in_handler = false;
    bool handled = false;

    SystemClock clock;
    ThreadPoolExecutor pool(2);
    SpoolChannel spool(dir, clock, 20, &pool);
    auto on_message = [&](const InboundMessage&) {
        clock.schedule_after(10, [&]() {
            std::lock_guard<std::mutex> lk(mu);
            timer_fired = true;
            cv.notify_all();
        });
        std::unique_lock<std::mutex> lk(mu);
        timer_seen_in_handler = cv.wait_for(lk, std::chrono::seconds(5), [&] { return timer_fired; });
        handled = true;
        cv.notify_all();
    };
    write_text(dir / "inbox" / "a.json", "{\"chat\":\"fam\",\"text\":\"hello\"}");
    expect_true(spool.connect(on_message).empty(), "connect");
    {
        std::unique_lock<std::mutex> lk(mu);
        cv.wait_for(lk, std::chrono::seconds(10), [&] { return handled; });
    }
    spool.disconnect();
    pool.shutdown();
    clock.stop();
    expect_true(handled, "inbox polled through the executor");
    expect_true(timer_seen_in_handler, "timer fired while a message was handled");
}

struct RouterRig {
    fs::path dir;
    HostState state;
    FakeLauncher launcher;
    AllowlistMountPolicy policy;
    ManualClock clock{1000};
    ManualExecutor exec;
    std::vector<std::pair<std::string, std::string>> notices;
    std::unique_ptr<SessionManager> sm;
    std::unique_ptr<GroupQueue> queue;
    std::unique_ptr<InboundRouter> router;

    RouterRig() : dir(fresh_dir("inbound_router")), policy(dir / "mount-allowlist.json") {
        SessionOptions so;
        so.agent_argv = {"agent-runtime"};
        so.groups_dir = dir / "groups";
        so.ipc_root = dir / "ipc";
        so.self_pump = false;
        SessionManager::Hooks sh;
        sh.send_message = [this](const std::string& jid, const std::string& text) { notices.emplace_back(jid, text); };
        sm = std::make_unique<SessionManager>(state, launcher, policy, clock, exec, so, sh);
        queue = std::make_unique<GroupQueue>(state, *sm, exec, clock, QueueOptions{}, GroupQueue::Hooks{});
        router = std::make_unique<InboundRouter>(state, *queue, clock, "Kestrel",
            [this](const std::string& jid, const std::string& text) { notices.emplace_back(jid, text); });
    }

    ~RouterRig() {
        queue->shutdown();
        sm->shutdown(0);
    }

    void add(const std::string& folder, const std::string& jid, bool trigger) {
        Group g;
        g.jid = jid;
        g.name = folder;
        g.folder = folder;
        g.requires_trigger = trigger;
        if (std::string err = state.register_group(g); !err.empty()) die("register_group: " + err);
    }

    InboundOutcome say(const std::string& jid, const std::string& text, const std::string& name = "Bob") {
        InboundMessage m;
        m.chat_jid = jid;
        m.sender = jid;
        m.sender_name = name;
        m.text = text;
        m.timestamp_ms = clock.now_ms();
        return router->on_message(m);
    }
};

static void test_router_outcomes() {
    RouterRig r;
    r.add(MAIN_GROUP_FOLDER, "spool:admin", true);
    r.add("team", "spool:team", true);
    r.add("solo", "spool:solo", false);

    expect_true(r.say("spool:team", "lunch?") == InboundOutcome::NO_TRIGGER, "trigger required");
    expect_true(r.say("spool:team", "@kestrel book a room") == InboundOutcome::QUEUED, "triggered");
    expect_true(r.say("spool:solo", "no mention needed") == InboundOutcome::QUEUED, "trigger not required");
    expect_true(r.say("spool:admin", "main never needs one") == InboundOutcome::QUEUED, "main exempt");
    expect_eq_ll((long long)r.queue->pending("team"), 1, "one entry for team");
    expect_true(r.say("spool:team", "") == InboundOutcome::IGNORED, "empty text ignored");

    InboundMessage mine;
    mine.chat_jid = "spool:team";
    mine.text = "@Kestrel echo";
    mine.from_me = true;
    expect_true(r.router->on_message(mine) == InboundOutcome::IGNORED, "own messages ignored");

    // Unknown senders wait for approval; main hears about them once.
    expect_true(r.say("spool:zoe", "hello", "Zoe") == InboundOutcome::PENDING_CONTACT, "stranger pending");
    expect_true(r.say("spool:zoe", "hello again", "Zoe") == InboundOutcome::PENDING_CONTACT, "still pending");
    expect_eq_ll((long long)r.notices.size(), 1, "one approval notice");
    expect_eq_str(r.notices[0].first, "spool:admin", "notice goes to main");
    expect_eq_str(r.notices[0].second, "New contact Zoe (spool:zoe) is waiting for approval.", "notice text");
    expect_eq_ll((long long)r.queue->pending("spool-zoe"), 0, "nothing queued for the stranger");

    expect_true(r.state.set_contact_status("spool:zoe", ContactStatus::BLOCKED, 2000).empty(), "block");
    expect_true(r.say("spool:zoe", "let me in") == InboundOutcome::BLOCKED, "blocked");

    expect_true(r.state.set_contact_status("spool:yan", ContactStatus::APPROVED, 2000).empty(), "approve");
    expect_true(r.say("spool:yan", "@Kestrel hi") == InboundOutcome::QUEUED, "approved contact reaches its group");
    expect_eq_ll((long long)r.queue->pending("spool-yan"), 1, "queued under the derived folder");

    r.queue->shutdown();
    expect_true(r.say("spool:solo", "after close") == InboundOutcome::IGNORED, "closed queue refuses");
    expect_eq_str(inbound_outcome_name(InboundOutcome::PENDING_CONTACT), "pending_contact", "outcome names");
}

int main() {
    set_log_threshold(LogLevel::ERROR);
    test_trigger();
    test_channel_router();
    test_spool_channel();
    test_spool_channel_on_executor();
    test_router_outcomes();
    std::cerr << "test_inbound: ALL PASSED" << std::endl;
    return 0;
}
