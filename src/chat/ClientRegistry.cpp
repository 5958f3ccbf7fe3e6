#include "chat/ClientRegistry.h"

namespace termchat::chat {

std::string SessionRecord::display_name() const {
    if (username) return *username;
    return "User_" + address;
}

const char* to_string(UsernameStatus status) noexcept {
    switch (status) {
        case UsernameStatus::Ok:             return "ok";
        case UsernameStatus::Unchanged:      return "unchanged";
        case UsernameStatus::Duplicate:      return "duplicate";
        case UsernameStatus::InvalidFormat:  return "invalid_format";
        case UsernameStatus::UnknownSession: return "unknown_session";
    }
    return "unknown";
}

ClientRegistry::ClientRegistry(InputValidator validator) : validator_(validator) {}

SessionId ClientRegistry::register_session(std::shared_ptr<Participant> participant, std::string address) {
    std::lock_guard<std::mutex> lk(mu_);

    SessionRecord record;
    record.id = next_id_++;
    record.participant = std::move(participant);
    record.address = std::move(address);
    record.connected_at = Clock::now();
    record.last_activity = record.connected_at;

    const SessionId id = record.id;
    sessions_.emplace(id, std::move(record));
    return id;
}

bool ClientRegistry::name_taken_locked(const std::string& name, SessionId requester) const {
    auto it = by_name_.find(name);
    return it != by_name_.end() && it->second != requester;
}

UsernameResult ClientRegistry::set_username(SessionId id, std::string_view name) {
    UsernameResult result;

    ValidationResult valid = validator_.validate_username(name);

    std::lock_guard<std::mutex> lk(mu_);

    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        result.status = UsernameStatus::UnknownSession;
        return result;
    }
    SessionRecord& record = it->second;
    result.previous = record.display_name();

    if (!valid.ok) {
        result.status = UsernameStatus::InvalidFormat;
        result.reason = std::move(valid.reason);
        return result;
    }

    result.username = valid.value;
    if (record.username && *record.username == valid.value) {
        result.status = UsernameStatus::Unchanged;
        return result;
    }
    if (name_taken_locked(valid.value, id)) {
        result.status = UsernameStatus::Duplicate;
        return result;
    }

    if (record.username) by_name_.erase(*record.username);
    by_name_.emplace(valid.value, id);
    record.username = std::move(valid.value);
    record.last_activity = Clock::now();

    result.status = UsernameStatus::Ok;
    return result;
}

std::optional<SessionRecord> ClientRegistry::unregister(SessionId id) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;

    SessionRecord record = std::move(it->second);
    sessions_.erase(it);
    if (record.username) by_name_.erase(*record.username);
    return record;
}

std::vector<protocol::RosterEntry> ClientRegistry::snapshot_users() const {
    std::lock_guard<std::mutex> lk(mu_);

    std::vector<protocol::RosterEntry> users;
    users.reserve(sessions_.size());
    for (const auto& [id, record] : sessions_) {
        users.push_back({record.display_name(), record.address});
    }
    return users;
}

ClientRegistry::ParticipantList ClientRegistry::participants() const {
    std::lock_guard<std::mutex> lk(mu_);

    ParticipantList list;
    list.reserve(sessions_.size());
    for (const auto& [id, record] : sessions_) {
        list.emplace_back(id, record.participant);
    }
    return list;
}

std::shared_ptr<Participant> ClientRegistry::participant(SessionId id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second.participant;
}

std::optional<SessionRecord> ClientRegistry::find(SessionId id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

bool ClientRegistry::touch(SessionId id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return false;
    it->second.last_activity = Clock::now();
    return true;
}

bool ClientRegistry::record_message(SessionId id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return false;
    ++it->second.message_count;
    it->second.last_activity = Clock::now();
    return true;
}

std::size_t ClientRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.size();
}

} // namespace termchat::chat
