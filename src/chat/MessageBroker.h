#pragma once

#include "chat/ClientRegistry.h"
#include "chat/Message.h"
#include "chat/Participant.hpp"

#include <boost/circular_buffer.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace termchat::chat {

// Fan-out and history. All broadcasts go through one mutex, so every
// recipient's outbound queue is fed in the same order. Lock order is
// broker -> registry; participants never call back into the broker.
class MessageBroker {
public:
    static constexpr std::size_t kDefaultHistorySize = 50;

    struct Stats {
        std::uint64_t broadcasts = 0;
        std::uint64_t deliveries = 0;
        std::uint64_t failed_deliveries = 0;
        std::size_t history_size = 0;
    };

    MessageBroker(ClientRegistry& registry,
                  std::size_t history_capacity = kDefaultHistorySize);

    MessageBroker(const MessageBroker&) = delete;
    MessageBroker& operator=(const MessageBroker&) = delete;

    // Returns the number of successful deliveries.
    std::size_t broadcast(const Message& message, std::optional<SessionId> exclude = std::nullopt);
    bool send_direct(SessionId id, const Message& message);

    void history_append(const Message& message);
    std::vector<Message> history_snapshot() const;

    // History append and broadcast as one step.
    std::size_t publish(const Message& message, std::optional<SessionId> exclude = std::nullopt);

    // Registers the session, then sends it the welcome notice and the
    // history, announces it to the others and broadcasts the roster.
    SessionId join(std::shared_ptr<Participant> participant, std::string address);

    // Idempotent. Returns the removed record when the session was present.
    std::optional<SessionRecord> leave(SessionId id);

    std::size_t broadcast_notice(const std::string& text, std::optional<SessionId> exclude = std::nullopt);
    std::size_t broadcast_roster();
    bool send_roster(SessionId id);

    Stats stats() const;
    ClientRegistry& registry() noexcept { return registry_; }

private:
    std::size_t broadcast_locked(const std::string& frame, std::optional<SessionId> exclude);
    bool deliver_locked(SessionId id, const std::shared_ptr<Participant>& participant, const std::string& frame);
    std::string roster_frame() const;

    ClientRegistry& registry_;

    mutable std::mutex mu_;
    boost::circular_buffer<Message> history_;
    Stats stats_;
};

} // namespace termchat::chat
