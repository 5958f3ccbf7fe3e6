#pragma once

#include "chat/Message.h"

#include <string>
#include <string_view>
#include <vector>

// Line-oriented wire format: TYPE|PAYLOAD\n
namespace termchat::chat::protocol {

inline constexpr char kSeparator = '|';
inline constexpr char kDelimiter = '\n';

inline constexpr std::string_view kTagChat = "MSG";
inline constexpr std::string_view kTagServer = "SRV";
inline constexpr std::string_view kTagUserList = "ULIST";
inline constexpr std::string_view kTagUserCommand = "CMD_USER";
inline constexpr std::string_view kTagCommand = "CMD";

enum class FrameType { Chat, Server, UserList, UserCommand, Command };

struct Frame {
    FrameType type = FrameType::Chat;
    std::string payload;
    bool raw = false;  // no recognized TYPE prefix; the whole line is chat text
};

struct RosterEntry {
    std::string username;
    std::string address;
};

std::string_view tag_of(FrameType type) noexcept;

// Newlines in the payload are stripped so one call always yields one frame.
std::string encode(FrameType type, std::string_view payload);

// Chat messages are rendered as "<sender>: <content>".
std::string encode(const Message& message);

// Never throws on malformed input. `line` may still carry its trailing "\n"
// or "\r\n".
Frame decode(std::string_view line);

// Replaces invalid UTF-8 sequences with U+FFFD and drops NUL bytes.
std::string sanitize_utf8(std::string_view bytes);

std::string encode_roster(const std::vector<RosterEntry>& entries);
std::vector<RosterEntry> decode_roster(std::string_view payload);

} // namespace termchat::chat::protocol
