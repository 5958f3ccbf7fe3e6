#include "security/ConnectionGate.h"

#include <utility>

namespace termchat::security {

// ---- ConnectionSlot ----

ConnectionSlot::ConnectionSlot(ConnectionSlot&& other) noexcept
    : gate_(std::exchange(other.gate_, nullptr)), ip_(std::move(other.ip_)) {}

ConnectionSlot& ConnectionSlot::operator=(ConnectionSlot&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = std::exchange(other.gate_, nullptr);
        ip_ = std::move(other.ip_);
    }
    return *this;
}

void ConnectionSlot::release() noexcept {
    if (auto* gate = std::exchange(gate_, nullptr)) gate->release(ip_);
}

// ---- ConnectionGate ----

ConnectionGate::ConnectionGate(std::size_t max_total, std::size_t max_per_ip)
    : max_total_(max_total), max_per_ip_(max_per_ip) {}

ConnectionGate::Admission ConnectionGate::admit(const std::string& ip) {
    std::lock_guard<std::mutex> lk(mu_);

    Admission result;
    if (closed_) {
        result.reason = RejectReason::Closed;
    } else if (active_ >= max_total_) {
        result.reason = RejectReason::ServerFull;
    } else {
        auto it = per_ip_.find(ip);
        const std::size_t current = it == per_ip_.end() ? 0 : it->second;
        if (current >= max_per_ip_) {
            result.reason = RejectReason::TooManyFromAddress;
        } else {
            per_ip_[ip] = current + 1;
            ++active_;
            ++admitted_;
            result.decision = Decision::Allowed;
            return result;
        }
    }

    ++rejected_;
    return result;
}

void ConnectionGate::release(const std::string& ip) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = per_ip_.find(ip);
    if (it == per_ip_.end()) return;

    if (--it->second == 0) per_ip_.erase(it);
    --active_;
}

std::optional<ConnectionSlot> ConnectionGate::acquire(const std::string& ip, RejectReason* reason) {
    Admission admission = admit(ip);
    if (reason) *reason = admission.reason;
    if (!admission) return std::nullopt;
    return std::optional<ConnectionSlot>(std::in_place, *this, ip);
}

void ConnectionGate::close() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
}

std::size_t ConnectionGate::active() const {
    std::lock_guard<std::mutex> lk(mu_);
    return active_;
}

std::size_t ConnectionGate::active_for(const std::string& ip) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = per_ip_.find(ip);
    return it == per_ip_.end() ? 0 : it->second;
}

ConnectionGate::Stats ConnectionGate::stats() const {
    std::lock_guard<std::mutex> lk(mu_);
    return Stats{active_, per_ip_.size(), admitted_, rejected_};
}

const char* to_string(ConnectionGate::RejectReason reason) noexcept {
    switch (reason) {
        case ConnectionGate::RejectReason::None:               return "none";
        case ConnectionGate::RejectReason::ServerFull:         return "server_full";
        case ConnectionGate::RejectReason::TooManyFromAddress: return "too_many_from_address";
        case ConnectionGate::RejectReason::Closed:             return "closed";
    }
    return "unknown";
}

} // namespace termchat::security
