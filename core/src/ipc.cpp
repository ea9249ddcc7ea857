#include "kestrel/ipc.h"
#include "kestrel/fsutil.h"
#include "kestrel/json_util.h"
#include "kestrel/scheduler.h"
#include "kestrel/timezone.h"

#include <algorithm>

namespace kestrel::ipc {

namespace {

template <typename... Fs>
struct overloaded : Fs... { using Fs::operator()...; };
template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

// Reads a required non-empty string field.
bool need_string(json_object* o, const char* key, std::string* out, std::string* err) {
    auto v = json::get_string(o, key);
    if (!v || v->empty()) {
        if (err) *err = std::string("missing or empty field \"") + key + "\"";
        return false;
    }
    *out = *v;
    return true;
}

} // namespace

const char* type_name(const TaskPayload& p) {
    return std::visit(overloaded{
        [](const SendMessage&) { return "send_message"; },
        [](const ScheduleTask&) { return "schedule_task"; },
        [](const PauseTask&) { return "pause_task"; },
        [](const ResumeTask&) { return "resume_task"; },
        [](const CancelTask&) { return "cancel_task"; },
        [](const ListTasks&) { return "list_tasks"; },
        [](const ApproveContact&) { return "approve_contact"; },
        [](const DenyContact&) { return "deny_contact"; },
        [](const RegisterGroup&) { return "register_group"; },
    }, p);
}

static std::optional<TaskPayload> decode_payload(const std::string& type, json_object* p, std::string* err) {
    if (type == "send_message" || type == "message") {
        SendMessage m;
        if (!need_string(p, "chatJid", &m.chat_jid, err)) return std::nullopt;
        if (!need_string(p, "text", &m.text, err)) return std::nullopt;
        return m;
    }
    if (type == "schedule_task") {
        ScheduleTask m;
        if (!need_string(p, "prompt", &m.prompt, err)) return std::nullopt;
        if (!need_string(p, "scheduleType", &m.schedule_type, err)) return std::nullopt;
        if (!need_string(p, "scheduleValue", &m.schedule_value, err)) return std::nullopt;
        if (!parse_schedule_kind(m.schedule_type)) {
            if (err) *err = "scheduleType must be cron, interval or once";
            return std::nullopt;
        }
        m.target_folder = json::get_string(p, "targetFolder").value_or("");
        m.context_mode = json::get_string(p, "contextMode").value_or("isolated");
        if (m.context_mode != "group" && m.context_mode != "isolated") {
            if (err) *err = "contextMode must be group or isolated";
            return std::nullopt;
        }
        return m;
    }
    if (type == "pause_task") {
        PauseTask m;
        if (!need_string(p, "taskId", &m.task_id, err)) return std::nullopt;
        return m;
    }
    if (type == "resume_task") {
        ResumeTask m;
        if (!need_string(p, "taskId", &m.task_id, err)) return std::nullopt;
        return m;
    }
    if (type == "cancel_task") {
        CancelTask m;
        if (!need_string(p, "taskId", &m.task_id, err)) return std::nullopt;
        return m;
    }
    if (type == "list_tasks") {
        return ListTasks{};
    }
    if (type == "approve_contact") {
        ApproveContact m;
        if (!need_string(p, "jid", &m.jid, err)) return std::nullopt;
        return m;
    }
    if (type == "deny_contact") {
        DenyContact m;
        if (!need_string(p, "jid", &m.jid, err)) return std::nullopt;
        return m;
    }
    if (type == "register_group") {
        RegisterGroup m;
        if (!need_string(p, "jid", &m.jid, err)) return std::nullopt;
        if (!need_string(p, "name", &m.name, err)) return std::nullopt;
        if (!need_string(p, "folder", &m.folder, err)) return std::nullopt;
        if (!is_valid_group_folder(m.folder)) {
            if (err) *err = "invalid folder \"" + m.folder + "\"";
            return std::nullopt;
        }
        m.requires_trigger = json::get_bool(p, "requiresTrigger").value_or(true);
        for (json_object* mo : json::get_object_array(p, "additionalMounts")) {
            AdditionalMount am;
            am.host_path = json::get_string(mo, "hostPath").value_or("");
            am.container_path = json::get_string(mo, "containerPath").value_or("");
            am.readonly = json::get_bool(mo, "readonly").value_or(true);
            if (am.host_path.empty()) {
                if (err) *err = "additionalMounts entry without hostPath";
                return std::nullopt;
            }
            m.additional_mounts.push_back(std::move(am));
        }
        return m;
    }
    if (err) *err = "unknown task type \"" + type + "\"";
    return std::nullopt;
}

std::optional<Envelope> decode_envelope(const std::string& text, std::string* err) {
    json::Doc d = json::parse(text);
    if (!d.is_object()) {
        if (err) *err = "not a complete JSON object";
        return std::nullopt;
    }
    std::string type;
    if (!need_string(d.root, "type", &type, err)) return std::nullopt;

    // Flat envelopes (fields beside "type") are accepted as well.
    json_object* payload = json::field(d.root, "payload");
    if (!payload) payload = d.root;
    if (!json_object_is_type(payload, json_type_object)) {
        if (err) *err = "payload must be an object";
        return std::nullopt;
    }

    auto p = decode_payload(type, payload, err);
    if (!p) return std::nullopt;

    Envelope e;
    e.payload = std::move(*p);
    e.source_group = json::get_string(d.root, "sourceGroupId").value_or("");
    e.created_at_ms = json::get_int(d.root, "createdAt").value_or(0);
    return e;
}

std::string encode_envelope(const Envelope& e) {
    json::ObjectBuilder payload;
    std::visit(overloaded{
        [&](const SendMessage& m) { payload.set("chatJid", m.chat_jid).set("text", m.text); },
        [&](const ScheduleTask& m) {
            payload.set("prompt", m.prompt).set("scheduleType", m.schedule_type)
                   .set("scheduleValue", m.schedule_value).set("contextMode", m.context_mode);
            if (!m.target_folder.empty()) payload.set("targetFolder", m.target_folder);
        },
        [&](const PauseTask& m) { payload.set("taskId", m.task_id); },
        [&](const ResumeTask& m) { payload.set("taskId", m.task_id); },
        [&](const CancelTask& m) { payload.set("taskId", m.task_id); },
        [&](const ListTasks&) {},
        [&](const ApproveContact& m) { payload.set("jid", m.jid); },
        [&](const DenyContact& m) { payload.set("jid", m.jid); },
        [&](const RegisterGroup& m) {
            payload.set("jid", m.jid).set("name", m.name).set("folder", m.folder)
                   .set_bool("requiresTrigger", m.requires_trigger);
            json_object* arr = json_object_new_array();
            for (const auto& am : m.additional_mounts) {
                json::ObjectBuilder mb;
                mb.set("hostPath", am.host_path).set_bool("readonly", am.readonly);
                if (!am.container_path.empty()) mb.set("containerPath", am.container_path);
                json_object_array_add(arr, mb.release());
            }
            payload.set_object("additionalMounts", arr);
        },
    }, e.payload);

    json::ObjectBuilder b;
    b.set("type", type_name(e.payload))
     .set("sourceGroupId", e.source_group)
     .set_object("payload", payload.release())
     .set("createdAt", e.created_at_ms);
    return b.str();
}

// ---------- input area ----------

std::filesystem::path group_dir(const std::filesystem::path& ipc_root, const std::string& folder) {
    return ipc_root / folder;
}

std::filesystem::path input_dir(const std::filesystem::path& ipc_root, const std::string& folder) {
    return ipc_root / folder / "input";
}

std::string write_input_message(const std::filesystem::path& ipc_root, const std::string& folder,
                                const std::string& text, int64_t now_ms) {
    json::ObjectBuilder b;
    b.set("type", "message").set("text", text).set("createdAt", now_ms);
    return write_atomic(input_dir(ipc_root, folder) / (unique_stem(now_ms) + ".json"), b.str() + "\n");
}

std::string write_close_sentinel(const std::filesystem::path& ipc_root, const std::string& folder) {
    return write_atomic(input_dir(ipc_root, folder) / "_close", "");
}

void reset_input(const std::filesystem::path& ipc_root, const std::string& folder) {
    std::error_code ec;
    auto dir = input_dir(ipc_root, folder);
    std::filesystem::create_directories(dir, ec);
    std::filesystem::remove(dir / "_close", ec);
    for (const auto& p : list_dir_json(dir)) std::filesystem::remove(p, ec);
}

// ---------- Dispatcher ----------

Dispatcher::Dispatcher(HostState& state, Scheduler& scheduler, Clock& clock,
                       std::filesystem::path ipc_root, Hooks hooks, EventLog* events)
    : state_(state), scheduler_(scheduler), clock_(clock),
      ipc_root_(std::move(ipc_root)), hooks_(std::move(hooks)), events_(events) {}

std::string Dispatcher::dispatch(const Envelope& env, const Group& issuer) {
    std::string err = std::visit([&](const auto& m) { return handle(m, env, issuer); }, env.payload);

    json::ObjectBuilder p;
    p.set("id", env.id).set("type", type_name(env.payload)).set("group", issuer.folder);
    if (!err.empty()) p.set("error", err);
    if (events_) events_->event(err.empty() ? "ipc_dispatched" : "ipc_rejected", p.str());

    if (err.empty()) {
        log_info("ipc", std::string(type_name(env.payload)) + " from " + issuer.folder + " dispatched");
    } else {
        log_warn("ipc", std::string(type_name(env.payload)) + " from " + issuer.folder + " rejected: " + err);
    }
    return err;
}

std::string Dispatcher::handle(const SendMessage& m, const Envelope&, const Group& issuer) {
    if (!issuer.is_main() && m.chat_jid != issuer.jid) {
        return "unauthorized: " + issuer.folder + " may only message its own chat";
    }
    if (!state_.group_by_jid(m.chat_jid)) return "unknown chat " + m.chat_jid;
    if (!hooks_.send_message || !hooks_.send_message(m.chat_jid, m.text)) {
        return "no channel for " + m.chat_jid;
    }
    return "";
}

std::string Dispatcher::handle(const ScheduleTask& m, const Envelope&, const Group& issuer) {
    std::string target = m.target_folder.empty() ? issuer.folder : m.target_folder;
    if (!issuer.is_main() && target != issuer.folder) {
        return "unauthorized: " + issuer.folder + " may only schedule tasks for itself";
    }
    auto g = state_.group_by_folder(target);
    if (!g) return "unknown target group " + target;

    ScheduledTask t;
    const int64_t now = clock_.now_ms();
    t.id = "task-" + unique_stem(now);
    t.group_folder = g->folder;
    t.chat_jid = g->jid;
    t.prompt = m.prompt;
    t.kind = *parse_schedule_kind(m.schedule_type);
    t.schedule_value = m.schedule_value;
    t.context_mode = m.context_mode;
    t.created_at_ms = now;
    return scheduler_.create(t);
}

std::string Dispatcher::own_task_check(const std::string& task_id, const Group& issuer) {
    auto t = scheduler_.get(task_id);
    if (!t) return "task " + task_id + " not found";
    if (!issuer.is_main() && t->group_folder != issuer.folder) {
        return "unauthorized: task " + task_id + " belongs to another group";
    }
    return "";
}

std::string Dispatcher::handle(const PauseTask& m, const Envelope&, const Group& issuer) {
    std::string err = own_task_check(m.task_id, issuer);
    return err.empty() ? scheduler_.pause(m.task_id) : err;
}

std::string Dispatcher::handle(const ResumeTask& m, const Envelope&, const Group& issuer) {
    std::string err = own_task_check(m.task_id, issuer);
    return err.empty() ? scheduler_.resume(m.task_id) : err;
}

std::string Dispatcher::handle(const CancelTask& m, const Envelope&, const Group& issuer) {
    std::string err = own_task_check(m.task_id, issuer);
    return err.empty() ? scheduler_.cancel(m.task_id) : err;
}

std::string Dispatcher::handle(const ListTasks&, const Envelope&, const Group& issuer) {
    auto tasks = scheduler_.list(issuer.is_main() ? "" : issuer.folder);
    json_object* arr = json_object_new_array();
    for (const auto& t : tasks) {
        json::ObjectBuilder b;
        b.set("id", t.id).set("groupFolder", t.group_folder).set("prompt", t.prompt)
         .set("scheduleType", schedule_kind_name(t.kind)).set("scheduleValue", t.schedule_value)
         .set("status", task_status_name(t.status))
         .set("nextRun", t.next_run_ms ? format_utc(t.next_run_ms) : std::string());
        json_object_array_add(arr, b.release());
    }
    const int64_t now = clock_.now_ms();
    json::ObjectBuilder root;
    root.set("type", "task_list").set_object("tasks", arr).set("createdAt", now);
    return write_atomic(input_dir(ipc_root_, issuer.folder) / (unique_stem(now) + ".json"), root.str() + "\n");
}

std::string Dispatcher::handle(const ApproveContact& m, const Envelope&, const Group& issuer) {
    if (!issuer.is_main()) return "unauthorized: only the main group may approve contacts";
    std::string err = state_.set_contact_status(m.jid, ContactStatus::APPROVED, clock_.now_ms());
    if (!err.empty()) return err;
    if (auto g = state_.group_by_jid(m.jid); g && hooks_.on_group_registered) hooks_.on_group_registered(*g);
    return "";
}

std::string Dispatcher::handle(const DenyContact& m, const Envelope&, const Group& issuer) {
    if (!issuer.is_main()) return "unauthorized: only the main group may deny contacts";
    return state_.set_contact_status(m.jid, ContactStatus::BLOCKED, clock_.now_ms());
}

std::string Dispatcher::handle(const RegisterGroup& m, const Envelope&, const Group& issuer) {
    if (!issuer.is_main()) return "unauthorized: only the main group may register groups";
    Group g;
    g.jid = m.jid;
    g.name = m.name;
    g.folder = m.folder;
    g.requires_trigger = m.requires_trigger;
    g.additional_mounts = m.additional_mounts;
    g.added_at_ms = clock_.now_ms();
    std::string err = state_.register_group(g);
    if (!err.empty()) return err;
    if (hooks_.on_group_registered) hooks_.on_group_registered(g);
    return "";
}

// ---------- Watcher ----------

Watcher::Watcher(std::filesystem::path ipc_root, HostState& state, Dispatcher& dispatcher,
                 Clock& clock, WatcherOptions opt, EventLog* events)
    : root_(std::move(ipc_root)), state_(state), dispatcher_(dispatcher),
      clock_(clock), opt_(opt), events_(events) {}

Watcher::~Watcher() { stop(); }

bool Watcher::seen_recently(const std::string& key, int64_t now) {
    std::lock_guard<std::mutex> lk(dedup_mu_);
    auto it = processed_.find(key);
    return it != processed_.end() && (now - it->second) < opt_.dedup_ttl_ms;
}

void Watcher::remember(const std::string& key, int64_t now) {
    std::lock_guard<std::mutex> lk(dedup_mu_);
    processed_[key] = now;
    if (processed_.size() > opt_.dedup_max / 2) {
        for (auto it = processed_.begin(); it != processed_.end(); ) {
            if (now - it->second > opt_.dedup_ttl_ms) it = processed_.erase(it);
            else ++it;
        }
    }
    // Hard cap: evict the oldest entries if pruning was not enough.
    while (processed_.size() > opt_.dedup_max) {
        auto oldest = std::min_element(processed_.begin(), processed_.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; });
        processed_.erase(oldest);
    }
}

ScanStats Watcher::process_file(const std::string& folder, const std::filesystem::path& file) {
    ScanStats st;
    const int64_t now = clock_.now_ms();
    const std::string key = folder + "/" + file.filename().string();
    std::error_code ec;

    if (seen_recently(key, now)) {
        std::filesystem::remove(file, ec);
        st.duplicates++;
        log_debug("ipc", "duplicate " + key + " ignored");
        return st;
    }

    auto body = slurp_file(file);
    if (!body) return st;  // vanished between listing and reading

    std::string err;
    auto env = decode_envelope(*body, &err);
    if (!env) {
        int64_t age = file_age_ms(file);
        if (age >= 0 && age < opt_.settle_ms) {
            st.deferred++;
            return st;
        }
        std::filesystem::create_directories(root_ / "errors", ec);
        std::filesystem::rename(file, root_ / "errors" / (folder + "-" + file.filename().string()), ec);
        if (ec) std::filesystem::remove(file, ec);
        log_error("ipc", "invalid envelope " + key + ": " + err);
        if (events_) {
            json::ObjectBuilder p;
            p.set("file", key).set("error", err);
            events_->event("ipc_invalid", p.str());
        }
        st.errors++;
        return st;
    }
    env->id = file.stem().string();

    auto issuer = state_.group_by_folder(folder);
    if (!issuer) {
        std::filesystem::remove(file, ec);
        log_warn("ipc", "envelope " + key + " from unregistered group folder rejected");
        st.rejected++;
        return st;
    }
    if (!env->source_group.empty() && env->source_group != folder) {
        std::filesystem::remove(file, ec);
        log_warn("ipc", "envelope " + key + " claims source " + env->source_group + ", rejected");
        if (events_) {
            json::ObjectBuilder p;
            p.set("file", key).set("claimed", env->source_group).set("group", folder);
            events_->event("ipc_source_mismatch", p.str());
        }
        st.rejected++;
        return st;
    }

    remember(key, now);
    std::string derr = dispatcher_.dispatch(*env, *issuer);
    std::filesystem::remove(file, ec);
    if (derr.empty()) st.dispatched++;
    else if (derr.rfind("unauthorized", 0) == 0) st.rejected++;
    else st.errors++;
    return st;
}

ScanStats Watcher::scan_once() {
    std::lock_guard<std::mutex> lk(scan_mu_);
    ScanStats total;
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) return total;

    std::vector<std::string> folders;
    for (auto& e : std::filesystem::directory_iterator(root_, ec)) {
        if (ec) break;
        if (!e.is_directory(ec)) continue;
        std::string name = e.path().filename().string();
        if (name == "errors" || !is_valid_group_folder(name)) continue;
        folders.push_back(name);
    }
    std::sort(folders.begin(), folders.end());

    for (const auto& folder : folders) {
        for (const char* sub : {"messages", "tasks"}) {
            for (const auto& f : list_dir_json(root_ / folder / sub)) {
                ScanStats s = process_file(folder, f);
                total.dispatched += s.dispatched;
                total.rejected += s.rejected;
                total.duplicates += s.duplicates;
                total.errors += s.errors;
                total.deferred += s.deferred;
            }
        }
    }
    return total;
}

void Watcher::arm() {
    timer_ = clock_.schedule_after(poll_ms_, [this]() {
        Executor* exec = nullptr;
        {
            std::lock_guard<std::mutex> lk(timer_mu_);
            if (!running_) return;
            exec = exec_;
        }
        auto run = [this]() {
            {
                std::lock_guard<std::mutex> lk(timer_mu_);
                if (!running_) return;
            }
            (void)scan_once();
            std::lock_guard<std::mutex> lk(timer_mu_);
            if (running_) arm();
        };
        if (exec) {
            if (!exec->submit(PRIO_MESSAGE, run)) log_warn("ipc", "executor closed, polling stops");
        } else {
            run();
        }
    });
}

void Watcher::start(int64_t poll_ms, Executor* exec) {
    std::lock_guard<std::mutex> lk(timer_mu_);
    if (running_) return;
    running_ = true;
    exec_ = exec;
    poll_ms_ = std::max<int64_t>(10, poll_ms);
    log_info("ipc", "watching " + root_.string() + " every " + std::to_string(poll_ms_) + "ms");
    arm();
}

void Watcher::stop() {
    std::lock_guard<std::mutex> lk(timer_mu_);
    if (!running_) return;
    running_ = false;
    if (timer_) clock_.cancel(timer_);
    timer_ = 0;
}

} // namespace kestrel::ipc
