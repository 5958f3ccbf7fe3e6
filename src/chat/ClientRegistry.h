#pragma once

#include "chat/Participant.hpp"
#include "chat/Protocol.h"
#include "chat/Validation.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace termchat::chat {

struct SessionRecord {
    using Clock = std::chrono::steady_clock;

    SessionId id = 0;
    std::shared_ptr<Participant> participant;
    std::optional<std::string> username;  // unset until the first accepted nickname
    std::string address;                  // "ip:port"
    Clock::time_point connected_at{};
    Clock::time_point last_activity{};
    std::uint64_t message_count = 0;

    // Name shown to other users: the username, or "User_<address>".
    std::string display_name() const;
};

enum class UsernameStatus { Ok, Unchanged, Duplicate, InvalidFormat, UnknownSession };

struct UsernameResult {
    UsernameStatus status = UsernameStatus::UnknownSession;
    std::string username;  // accepted (sanitized) name
    std::string previous;  // display name before the change
    std::string reason;    // set for InvalidFormat

    bool ok() const noexcept { return status == UsernameStatus::Ok; }
};

const char* to_string(UsernameStatus status) noexcept;

// Live sessions keyed by id. Every read and write goes through one mutex;
// callers only ever get copies.
class ClientRegistry {
public:
    using Clock = SessionRecord::Clock;
    using ParticipantList = std::vector<std::pair<SessionId, std::shared_ptr<Participant>>>;

    explicit ClientRegistry(InputValidator validator = InputValidator{});

    ClientRegistry(const ClientRegistry&) = delete;
    ClientRegistry& operator=(const ClientRegistry&) = delete;

    SessionId register_session(std::shared_ptr<Participant> participant, std::string address);

    // Validation, uniqueness check and insert are one critical section.
    UsernameResult set_username(SessionId id, std::string_view name);

    // Idempotent: absent ids yield std::nullopt.
    std::optional<SessionRecord> unregister(SessionId id);

    // Ordered by connect time.
    std::vector<protocol::RosterEntry> snapshot_users() const;
    ParticipantList participants() const;

    std::shared_ptr<Participant> participant(SessionId id) const;
    std::optional<SessionRecord> find(SessionId id) const;

    bool touch(SessionId id);
    bool record_message(SessionId id);

    std::size_t size() const;
    bool empty() const { return size() == 0; }

    const InputValidator& validator() const noexcept { return validator_; }

private:
    bool name_taken_locked(const std::string& name, SessionId requester) const;

    InputValidator validator_;

    mutable std::mutex mu_;
    std::map<SessionId, SessionRecord> sessions_;
    std::unordered_map<std::string, SessionId> by_name_;
    SessionId next_id_ = 1;
};

} // namespace termchat::chat
