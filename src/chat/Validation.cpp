#include "chat/Validation.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace termchat::chat {

namespace {

// Protocol and roster delimiters: TYPE|PAYLOAD and name(addr),name(addr)
constexpr std::string_view kForbiddenNameChars = "|,()";

constexpr std::array<std::string_view, 3> kReservedNames = {"server", "system", "admin"};

// Prefix of the display name given to sessions without a username.
constexpr std::string_view kDefaultNamePrefix = "User_";

} // namespace

bool InputValidator::is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool InputValidator::is_control(unsigned char c) noexcept {
    return c < 0x20 || c == 0x7F;
}

std::size_t InputValidator::code_points(std::string_view s) noexcept {
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string InputValidator::trim_copy(std::string s) {
    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;

    std::size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;

    if (start == 0 && end == s.size()) return s;
    return s.substr(start, end - start);
}

bool InputValidator::is_reserved(std::string_view name) {
    if (name.substr(0, kDefaultNamePrefix.size()) == kDefaultNamePrefix) return true;

    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(kReservedNames.begin(), kReservedNames.end(), lower) != kReservedNames.end();
}

ValidationResult InputValidator::validate_username(std::string_view name) const {
    ValidationResult result;
    std::string s = trim_copy(std::string(name));

    if (s.empty()) {
        result.reason = "Username cannot be empty";
        return result;
    }
    if (code_points(s) > max_name_len_) {
        result.reason = "Username too long (max " + std::to_string(max_name_len_) + " characters)";
        return result;
    }
    for (char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        if (is_control(uc) || is_space(c) || kForbiddenNameChars.find(c) != std::string_view::npos) {
            result.reason = "Username contains invalid characters";
            return result;
        }
    }
    if (is_reserved(s)) {
        result.reason = "Username is reserved";
        return result;
    }

    result.ok = true;
    result.value = std::move(s);
    return result;
}

ValidationResult InputValidator::validate_message(std::string_view text) const {
    ValidationResult result;

    std::string s;
    s.reserve(text.size());
    for (char c : text) {
        if (c == '\t') {
            s.push_back(' ');
        } else if (!is_control(static_cast<unsigned char>(c))) {
            s.push_back(c);
        }
    }
    s = trim_copy(std::move(s));

    if (s.empty()) {
        result.reason = "Message cannot be empty";
        return result;
    }
    if (code_points(s) > max_message_len_) {
        result.reason = "Message too long (max " + std::to_string(max_message_len_) + " characters)";
        return result;
    }

    result.ok = true;
    result.value = std::move(s);
    return result;
}

} // namespace termchat::chat
