#include "chat/MessageBroker.h"
#include "chat/Protocol.h"
#include "common/Logging.h"

#include <algorithm>

namespace termchat::chat {

MessageBroker::MessageBroker(ClientRegistry& registry, std::size_t history_capacity)
    : registry_(registry), history_(std::max<std::size_t>(history_capacity, 1)) {}

bool MessageBroker::deliver_locked(SessionId id, const std::shared_ptr<Participant>& participant,
                                   const std::string& frame) {
    if (!participant) return false;
    if (participant->deliver(frame)) {
        ++stats_.deliveries;
        return true;
    }

    ++stats_.failed_deliveries;
    TERMCHAT_LOG_DEBUG("delivery to session {} failed; closing it", id);
    participant->close();
    return false;
}

std::size_t MessageBroker::broadcast_locked(const std::string& frame, std::optional<SessionId> exclude) {
    ++stats_.broadcasts;
    std::size_t delivered = 0;
    for (const auto& [id, participant] : registry_.participants()) {
        if (exclude && *exclude == id) continue;
        if (deliver_locked(id, participant, frame)) ++delivered;
    }
    return delivered;
}

std::string MessageBroker::roster_frame() const {
    return protocol::encode(protocol::FrameType::UserList, protocol::encode_roster(registry_.snapshot_users()));
}

std::size_t MessageBroker::broadcast(const Message& message, std::optional<SessionId> exclude) {
    const std::string frame = protocol::encode(message);
    std::lock_guard<std::mutex> lk(mu_);
    return broadcast_locked(frame, exclude);
}

bool MessageBroker::send_direct(SessionId id, const Message& message) {
    const std::string frame = protocol::encode(message);
    std::lock_guard<std::mutex> lk(mu_);
    return deliver_locked(id, registry_.participant(id), frame);
}

void MessageBroker::history_append(const Message& message) {
    std::lock_guard<std::mutex> lk(mu_);
    history_.push_back(message);
}

std::vector<Message> MessageBroker::history_snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return std::vector<Message>(history_.begin(), history_.end());
}

std::size_t MessageBroker::publish(const Message& message, std::optional<SessionId> exclude) {
    const std::string frame = protocol::encode(message);
    std::lock_guard<std::mutex> lk(mu_);
    history_.push_back(message);
    return broadcast_locked(frame, exclude);
}

SessionId MessageBroker::join(std::shared_ptr<Participant> participant, std::string address) {
    std::lock_guard<std::mutex> lk(mu_);

    const SessionId id = registry_.register_session(participant, std::move(address));
    const auto record = registry_.find(id);
    const std::string name = record ? record->display_name() : std::string{};

    deliver_locked(id, participant,
                   protocol::encode(protocol::FrameType::Server, "Welcome to the chat, " + name + "!"));
    for (const Message& message : history_) {
        deliver_locked(id, participant, protocol::encode(message));
    }

    broadcast_locked(protocol::encode(protocol::FrameType::Server, name + " has joined the chat."), id);
    broadcast_locked(roster_frame(), std::nullopt);
    return id;
}

std::optional<SessionRecord> MessageBroker::leave(SessionId id) {
    std::lock_guard<std::mutex> lk(mu_);

    auto record = registry_.unregister(id);
    if (!record) return std::nullopt;

    broadcast_locked(protocol::encode(protocol::FrameType::Server, record->display_name() + " has left the chat."),
                     std::nullopt);
    broadcast_locked(roster_frame(), std::nullopt);
    return record;
}

std::size_t MessageBroker::broadcast_notice(const std::string& text, std::optional<SessionId> exclude) {
    return broadcast(Message::notice(text), exclude);
}

std::size_t MessageBroker::broadcast_roster() {
    std::lock_guard<std::mutex> lk(mu_);
    return broadcast_locked(roster_frame(), std::nullopt);
}

bool MessageBroker::send_roster(SessionId id) {
    std::lock_guard<std::mutex> lk(mu_);
    return deliver_locked(id, registry_.participant(id), roster_frame());
}

MessageBroker::Stats MessageBroker::stats() const {
    std::lock_guard<std::mutex> lk(mu_);
    Stats out = stats_;
    out.history_size = history_.size();
    return out;
}

} // namespace termchat::chat
