#include "kestrel/inbound.h"
#include "kestrel/json_util.h"

#include <cctype>

namespace kestrel {

const char* inbound_outcome_name(InboundOutcome o) {
    switch (o) {
        case InboundOutcome::QUEUED: return "queued";
        case InboundOutcome::NO_TRIGGER: return "no_trigger";
        case InboundOutcome::PENDING_CONTACT: return "pending_contact";
        case InboundOutcome::BLOCKED: return "blocked";
        case InboundOutcome::IGNORED: return "ignored";
    }
    return "unknown";
}

bool has_trigger(const std::string& text, const std::string& assistant_name) {
    if (assistant_name.empty()) return false;
    size_t i = 0;
    while (i < text.size() && std::isspace((unsigned char)text[i])) i++;
    if (i >= text.size() || text[i] != '@') return false;
    i++;
    if (text.size() - i < assistant_name.size()) return false;
    for (size_t k = 0; k < assistant_name.size(); k++) {
        if (std::tolower((unsigned char)text[i + k]) != std::tolower((unsigned char)assistant_name[k])) return false;
    }
    size_t end = i + assistant_name.size();
    if (end == text.size()) return true;
    unsigned char next = (unsigned char)text[end];
    return !(std::isalnum(next) || next == '_');
}

InboundRouter::InboundRouter(HostState& state, GroupQueue& queue, Clock& clock,
                             std::string assistant_name, NotifyFn notify, EventLog* events)
    : state_(state), queue_(queue), clock_(clock), name_(std::move(assistant_name)),
      notify_(std::move(notify)), events_(events) {}

InboundOutcome InboundRouter::on_message(const InboundMessage& m) {
    if (m.from_me || m.text.empty()) return InboundOutcome::IGNORED;

    auto contact = state_.contact(m.chat_jid);
    if (contact && contact->status == ContactStatus::BLOCKED) {
        log_debug("inbound", "ignoring message from blocked " + m.chat_jid);
        return InboundOutcome::BLOCKED;
    }

    auto group = state_.group_by_jid(m.chat_jid);
    if (!group) {
        const bool first_seen = !contact;
        ContactStatus st = state_.note_contact(m.chat_jid, m.sender_name, clock_.now_ms());
        if (st == ContactStatus::BLOCKED) return InboundOutcome::BLOCKED;
        if (first_seen) {
            log_info("inbound", "new contact " + m.chat_jid + " (" + m.sender_name + ") pending approval");
            if (events_) {
                json::ObjectBuilder p;
                p.set("jid", m.chat_jid).set("name", m.sender_name);
                events_->event("contact_pending", p.str());
            }
            auto main = state_.group_by_folder(MAIN_GROUP_FOLDER);
            if (main && notify_) {
                notify_(main->jid, "New contact " + (m.sender_name.empty() ? m.chat_jid : m.sender_name) +
                                   " (" + m.chat_jid + ") is waiting for approval.");
            }
        }
        return InboundOutcome::PENDING_CONTACT;
    }

    if (!group->is_main() && group->requires_trigger && !has_trigger(m.text, name_)) {
        return InboundOutcome::NO_TRIGGER;
    }

    WakeEntry e;
    e.group_jid = group->jid;
    e.kind = WakeKind::MESSAGE;
    e.sender = m.sender;
    e.sender_name = m.sender_name;
    e.text = m.text;
    e.message_ts_ms = m.timestamp_ms;
    e.enqueued_ms = clock_.now_ms();
    if (!queue_.enqueue(group->folder, std::move(e))) {
        log_warn("inbound", "queue closed, message for " + group->folder + " not accepted");
        return InboundOutcome::IGNORED;
    }
    return InboundOutcome::QUEUED;
}

} // namespace kestrel
