#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace termchat::chat {

enum class MessageType { Chat, Server, UserList, Command };

// One chat or system message. Read-only once built; history entries are
// shared between all readers of a snapshot.
class Message {
public:
    using Clock = std::chrono::system_clock;

    Message(MessageType type, std::string sender, std::string content,
            Clock::time_point timestamp = Clock::now())
        : type_(type),
          sender_(std::move(sender)),
          content_(std::move(content)),
          timestamp_(timestamp) {}

    static Message chat(std::string sender, std::string text) {
        return Message(MessageType::Chat, std::move(sender), std::move(text));
    }
    static Message notice(std::string text) {
        return Message(MessageType::Server, "Server", std::move(text));
    }
    static Message roster(std::string payload) {
        return Message(MessageType::UserList, "Server", std::move(payload));
    }

    MessageType type() const noexcept { return type_; }
    const std::string& sender() const noexcept { return sender_; }
    const std::string& content() const noexcept { return content_; }
    Clock::time_point timestamp() const noexcept { return timestamp_; }

private:
    MessageType type_;
    std::string sender_;
    std::string content_;
    Clock::time_point timestamp_;
};

} // namespace termchat::chat
