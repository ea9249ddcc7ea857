#pragma once

#include "channel.h"
#include "clock.h"
#include "group_queue.h"
#include "host_state.h"
#include "log.h"

#include <functional>
#include <string>

namespace kestrel {

enum class InboundOutcome {
    QUEUED,
    NO_TRIGGER,       // group requires "@<name>" and the message lacks it
    PENDING_CONTACT,  // unknown sender, waiting for approval
    BLOCKED,
    IGNORED,          // own message, empty text, or queue closed
};

const char* inbound_outcome_name(InboundOutcome o);

// True if text starts (after leading whitespace) with "@<name>" followed by
// a non-word character or the end. Case-insensitive.
bool has_trigger(const std::string& text, const std::string& assistant_name);

// Channel adapters call on_message(); the router applies contact policy and
// trigger rules, then enqueues a message wake for the group.
class InboundRouter {
public:
    // Sends a notice to a jid (normally ChannelRouter::send).
    using NotifyFn = std::function<void(const std::string& jid, const std::string& text)>;

    InboundRouter(HostState& state, GroupQueue& queue, Clock& clock,
                  std::string assistant_name, NotifyFn notify = {}, EventLog* events = nullptr);

    InboundOutcome on_message(const InboundMessage& m);

private:
    HostState& state_;
    GroupQueue& queue_;
    Clock& clock_;
    std::string name_;
    NotifyFn notify_;
    EventLog* events_;
};

} // namespace kestrel
