#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include "command_line.hpp"

// Target staged by 'ssh user@host' until credentials arrive. Holds at most
// one target; a staged target expires after the configured lifetime.
class PendingConnection {
public:
    using Clock = std::chrono::steady_clock;

    explicit PendingConnection(std::chrono::seconds ttl);

    // Replaces any staged target.
    void stage(const SshTarget& target, Clock::time_point now = Clock::now());

    // The staged target, or nothing when none is staged or it expired.
    std::optional<SshTarget> get(Clock::time_point now = Clock::now()) const;

    // True when a target was staged but has outlived its lifetime.
    bool expired(Clock::time_point now = Clock::now()) const;

    void clear();

    std::chrono::seconds ttl() const { return ttl_; }

private:
    mutable std::mutex mutex_;
    std::chrono::seconds ttl_;
    std::optional<SshTarget> target_;
    Clock::time_point staged_at_;
};
