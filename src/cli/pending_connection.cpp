#include "pending_connection.hpp"

PendingConnection::PendingConnection(std::chrono::seconds ttl) : ttl_(ttl) {}

void PendingConnection::stage(const SshTarget& target, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    target_ = target;
    staged_at_ = now;
}

std::optional<SshTarget> PendingConnection::get(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!target_ || now - staged_at_ >= ttl_) return std::nullopt;
    return target_;
}

bool PendingConnection::expired(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return target_ && now - staged_at_ >= ttl_;
}

void PendingConnection::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    target_.reset();
}
