#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/types.hpp"

namespace mahilo::delivery {

// Exactly what goes over the wire for one target, minus the per-attempt
// signature and timestamp headers
struct DeliveryEnvelope {
    core::DeliveryTarget target;
    std::string body;                       // serialized JSON, resent byte-for-byte
    std::optional<std::string> group_id;    // fan-out only
};

struct RetryTask {
    DeliveryEnvelope envelope;
    std::string connection_id;
    int retry_count = 0;
    core::TimePoint next_at;
};

// Outstanding retries, keyed by delivery target. Direct messages and
// fan-out rows share the set; the target kind says which row to update.
// Process-local: contents are lost on restart.
class RetryQueue {
public:
    RetryQueue() = default;

    // Non-copyable
    RetryQueue(const RetryQueue&) = delete;
    RetryQueue& operator=(const RetryQueue&) = delete;

    // Insert or replace the task for its target
    void upsert(const RetryTask& task);

    bool remove(const core::DeliveryTarget& target);

    std::optional<RetryTask> find(const core::DeliveryTarget& target) const;

    // Snapshot of tasks whose next_at has elapsed, earliest first
    std::vector<RetryTask> due(core::TimePoint now) const;

    std::size_t size() const;
    std::size_t size(core::TargetKind kind) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RetryTask> tasks_;
};

} // namespace mahilo::delivery
