#pragma once
#include <chrono>
#include <string>
#include "core/types.hpp"
#include "delivery/retry_queue.hpp"
#include "net/http_client.hpp"
#include "store/store.hpp"
#include "util/clock.hpp"

namespace mahilo::delivery {

struct DispatchOptions {
    int max_retries = 5;
    int timeout_ms = 30000;
};

// Outcome of one attempt
struct DeliveryResult {
    bool success = false;
    core::MessageStatus status = core::MessageStatus::PENDING;
    int http_status = 0;
    std::string error;
};

// Delay before the n-th retry: 1s, 2s, 4s, ...
std::chrono::milliseconds backoff_delay(int retry_count);

// Signs and POSTs a single webhook attempt, then records the outcome:
// success marks the row delivered; failure bumps the persisted retry
// count and either schedules the next retry or finalizes the row failed.
class DeliveryDispatcher {
public:
    DeliveryDispatcher(store::MessageLedger& ledger,
                       store::ConnectionRegistry& connections,
                       net::HttpClient& http,
                       RetryQueue& queue,
                       util::Clock& clock,
                       DispatchOptions options);

    // Non-copyable
    DeliveryDispatcher(const DeliveryDispatcher&) = delete;
    DeliveryDispatcher& operator=(const DeliveryDispatcher&) = delete;

    DeliveryResult deliver(const core::AgentConnection& connection, const DeliveryEnvelope& envelope);

    // Terminal failure outside an attempt (e.g. the connection is gone)
    void fail(const core::DeliveryTarget& target, const std::string& reason);

    const DispatchOptions& options() const { return options_; }

private:
    net::HeaderList build_headers(const core::AgentConnection& connection,
                                  const DeliveryEnvelope& envelope) const;

    DeliveryResult record_failure(const core::AgentConnection& connection,
                                  const DeliveryEnvelope& envelope,
                                  int http_status,
                                  const std::string& error);

    // Re-derives a fan-out parent once one of its rows settles
    void settle_parent(const core::DeliveryTarget& target);

    store::MessageLedger& ledger_;
    store::ConnectionRegistry& connections_;
    net::HttpClient& http_;
    RetryQueue& queue_;
    util::Clock& clock_;
    DispatchOptions options_;
};

} // namespace mahilo::delivery
