#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace termchat::security {

class ConnectionGate;

// Move-only handle for one admitted connection; releases its slot exactly once.
class ConnectionSlot {
public:
    ConnectionSlot() = default;
    ConnectionSlot(ConnectionGate& gate, std::string ip) : gate_(&gate), ip_(std::move(ip)) {}
    ~ConnectionSlot() { release(); }

    ConnectionSlot(ConnectionSlot&& other) noexcept;
    ConnectionSlot& operator=(ConnectionSlot&& other) noexcept;
    ConnectionSlot(const ConnectionSlot&) = delete;
    ConnectionSlot& operator=(const ConnectionSlot&) = delete;

    void release() noexcept;

    bool held() const noexcept { return gate_ != nullptr; }
    const std::string& ip() const noexcept { return ip_; }

private:
    ConnectionGate* gate_ = nullptr;
    std::string ip_;
};

// Global and per-IP concurrent connection ceilings.
class ConnectionGate {
public:
    enum class Decision { Allowed, Rejected };
    enum class RejectReason { None, ServerFull, TooManyFromAddress, Closed };

    struct Admission {
        Decision decision = Decision::Rejected;
        RejectReason reason = RejectReason::None;

        explicit operator bool() const noexcept { return decision == Decision::Allowed; }
    };

    struct Stats {
        std::size_t active = 0;
        std::size_t addresses = 0;
        std::uint64_t admitted = 0;
        std::uint64_t rejected = 0;
    };

    ConnectionGate(std::size_t max_total, std::size_t max_per_ip);

    ConnectionGate(const ConnectionGate&) = delete;
    ConnectionGate& operator=(const ConnectionGate&) = delete;

    // Check and increment happen under one lock.
    Admission admit(const std::string& ip);
    // No-op for addresses with no active connections.
    void release(const std::string& ip);

    // admit() wrapped in an RAII slot. `reason` receives the rejection cause.
    std::optional<ConnectionSlot> acquire(const std::string& ip, RejectReason* reason = nullptr);

    // Every later admit() is rejected with RejectReason::Closed.
    void close();

    std::size_t active() const;
    std::size_t active_for(const std::string& ip) const;
    Stats stats() const;

    std::size_t max_total() const noexcept { return max_total_; }
    std::size_t max_per_ip() const noexcept { return max_per_ip_; }

private:
    const std::size_t max_total_;
    const std::size_t max_per_ip_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, std::size_t> per_ip_;
    std::size_t active_ = 0;
    bool closed_ = false;
    std::uint64_t admitted_ = 0;
    std::uint64_t rejected_ = 0;
};

const char* to_string(ConnectionGate::RejectReason reason) noexcept;

} // namespace termchat::security
