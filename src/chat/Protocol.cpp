#include "chat/Protocol.h"

namespace termchat::chat::protocol {

namespace {

constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

bool is_continuation(unsigned char c) noexcept { return (c & 0xC0) == 0x80; }

// Length of the valid UTF-8 sequence starting at `i`, or 0 if invalid.
std::size_t valid_sequence_length(std::string_view s, std::size_t i) noexcept {
    const auto c0 = static_cast<unsigned char>(s[i]);
    const std::size_t left = s.size() - i;

    if (c0 < 0x80) return 1;

    if (c0 >= 0xC2 && c0 <= 0xDF) {
        if (left >= 2 && is_continuation(static_cast<unsigned char>(s[i + 1]))) return 2;
        return 0;
    }

    if (c0 >= 0xE0 && c0 <= 0xEF) {
        if (left < 3) return 0;
        const auto c1 = static_cast<unsigned char>(s[i + 1]);
        const auto c2 = static_cast<unsigned char>(s[i + 2]);
        if (!is_continuation(c1) || !is_continuation(c2)) return 0;
        if (c0 == 0xE0 && c1 < 0xA0) return 0;  // overlong
        if (c0 == 0xED && c1 > 0x9F) return 0;  // surrogates
        return 3;
    }

    if (c0 >= 0xF0 && c0 <= 0xF4) {
        if (left < 4) return 0;
        const auto c1 = static_cast<unsigned char>(s[i + 1]);
        const auto c2 = static_cast<unsigned char>(s[i + 2]);
        const auto c3 = static_cast<unsigned char>(s[i + 3]);
        if (!is_continuation(c1) || !is_continuation(c2) || !is_continuation(c3)) return 0;
        if (c0 == 0xF0 && c1 < 0x90) return 0;  // overlong
        if (c0 == 0xF4 && c1 > 0x8F) return 0;  // beyond U+10FFFF
        return 4;
    }

    return 0;
}

std::string strip_newlines(std::string_view payload) {
    std::string out;
    out.reserve(payload.size());
    for (char c : payload) {
        if (c != '\n' && c != '\r') out.push_back(c);
    }
    return out;
}

} // namespace

std::string_view tag_of(FrameType type) noexcept {
    switch (type) {
        case FrameType::Chat:        return kTagChat;
        case FrameType::Server:      return kTagServer;
        case FrameType::UserList:    return kTagUserList;
        case FrameType::UserCommand: return kTagUserCommand;
        case FrameType::Command:     return kTagCommand;
    }
    return kTagChat;
}

std::string encode(FrameType type, std::string_view payload) {
    const std::string_view tag = tag_of(type);
    const std::string body = strip_newlines(payload);

    std::string frame;
    frame.reserve(tag.size() + body.size() + 2);
    frame.append(tag);
    frame.push_back(kSeparator);
    frame.append(body);
    frame.push_back(kDelimiter);
    return frame;
}

std::string encode(const Message& message) {
    switch (message.type()) {
        case MessageType::Chat:
            return encode(FrameType::Chat, message.sender() + ": " + message.content());
        case MessageType::Server:
            return encode(FrameType::Server, message.content());
        case MessageType::UserList:
            return encode(FrameType::UserList, message.content());
        case MessageType::Command:
            return encode(FrameType::Command, message.content());
    }
    return encode(FrameType::Server, message.content());
}

Frame decode(std::string_view line) {
    if (!line.empty() && line.back() == '\n') line.remove_suffix(1);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    Frame frame;
    frame.payload = sanitize_utf8(line);

    const auto sep = frame.payload.find(kSeparator);
    if (sep == std::string::npos) {
        frame.raw = true;
        return frame;
    }

    const std::string_view tag(frame.payload.data(), sep);
    if (tag == kTagChat) {
        frame.type = FrameType::Chat;
    } else if (tag == kTagServer) {
        frame.type = FrameType::Server;
    } else if (tag == kTagUserList) {
        frame.type = FrameType::UserList;
    } else if (tag == kTagUserCommand) {
        frame.type = FrameType::UserCommand;
    } else if (tag == kTagCommand) {
        frame.type = FrameType::Command;
    } else {
        frame.raw = true;
        return frame;
    }

    frame.payload.erase(0, sep + 1);
    return frame;
}

std::string sanitize_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size()) {
        if (bytes[i] == '\0') {
            ++i;
            continue;
        }
        const std::size_t n = valid_sequence_length(bytes, i);
        if (n == 0) {
            out.append(kReplacement);
            ++i;
            continue;
        }
        out.append(bytes.substr(i, n));
        i += n;
    }
    return out;
}

std::string encode_roster(const std::vector<RosterEntry>& entries) {
    std::string out;
    for (const auto& e : entries) {
        if (!out.empty()) out.push_back(',');
        out += e.username;
        out.push_back('(');
        out += e.address;
        out.push_back(')');
    }
    return out;
}

std::vector<RosterEntry> decode_roster(std::string_view payload) {
    std::vector<RosterEntry> entries;

    while (!payload.empty()) {
        const auto comma = payload.find(',');
        std::string_view item = payload.substr(0, comma);
        payload = comma == std::string_view::npos ? std::string_view{} : payload.substr(comma + 1);

        const auto open = item.rfind('(');
        if (open == std::string_view::npos || item.empty() || item.back() != ')') {
            if (!item.empty()) entries.push_back({std::string(item), std::string()});
            continue;
        }
        entries.push_back({std::string(item.substr(0, open)),
                           std::string(item.substr(open + 1, item.size() - open - 2))});
    }
    return entries;
}

} // namespace termchat::chat::protocol
