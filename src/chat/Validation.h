#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace termchat::chat {

struct ValidationResult {
    bool ok = false;
    std::string value;   // sanitized input, meaningful only when ok
    std::string reason;  // user-facing, meaningful only when !ok
};

// Username and chat-text rules. Lengths are counted in code points.
class InputValidator {
public:
    static constexpr std::size_t kDefaultMaxNameLen = 50;
    static constexpr std::size_t kDefaultMaxMessageLen = 1000;

    explicit InputValidator(std::size_t max_name_len = kDefaultMaxNameLen,
                            std::size_t max_message_len = kDefaultMaxMessageLen) noexcept
        : max_name_len_(max_name_len), max_message_len_(max_message_len) {}

    // Surrounding whitespace is trimmed; anything else that breaks a rule
    // rejects the name. Over-length names are rejected, never truncated.
    ValidationResult validate_username(std::string_view name) const;

    // Control characters are dropped (tabs become spaces) and the text is
    // trimmed before the empty/length checks.
    ValidationResult validate_message(std::string_view text) const;

    std::size_t max_name_len() const noexcept { return max_name_len_; }
    std::size_t max_message_len() const noexcept { return max_message_len_; }

    static std::size_t code_points(std::string_view s) noexcept;
    static std::string trim_copy(std::string s);

private:
    static bool is_space(char c) noexcept;
    static bool is_control(unsigned char c) noexcept;
    static bool is_reserved(std::string_view name);

    std::size_t max_name_len_;
    std::size_t max_message_len_;
};

} // namespace termchat::chat
