#include "delivery/dispatcher.hpp"
#include "crypto/signature.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace mahilo::delivery {

using core::DeliveryTarget;
using core::MessageStatus;
using core::TargetKind;

std::chrono::milliseconds backoff_delay(int retry_count) {
    int exponent = std::clamp(retry_count - 1, 0, 30);
    return std::chrono::milliseconds(1000LL << exponent);
}

DeliveryDispatcher::DeliveryDispatcher(store::MessageLedger& ledger,
                                       store::ConnectionRegistry& connections,
                                       net::HttpClient& http,
                                       RetryQueue& queue,
                                       util::Clock& clock,
                                       DispatchOptions options)
    : ledger_(ledger)
    , connections_(connections)
    , http_(http)
    , queue_(queue)
    , clock_(clock)
    , options_(options) {}

net::HeaderList DeliveryDispatcher::build_headers(const core::AgentConnection& connection,
                                                  const DeliveryEnvelope& envelope) const {
    const int64_t timestamp = util::to_unix_seconds(clock_.now());

    net::HeaderList headers = {
        {"Content-Type", "application/json"},
        {"X-Mahilo-Signature", crypto::sign_webhook(connection.callback_secret, timestamp, envelope.body)},
        {"X-Mahilo-Timestamp", std::to_string(timestamp)},
        {"X-Mahilo-Message-Id", envelope.target.message_id},
    };
    if (envelope.target.kind == TargetKind::DELIVERY) {
        headers.emplace_back("X-Mahilo-Delivery-Id", envelope.target.id);
    }
    if (envelope.group_id) {
        headers.emplace_back("X-Mahilo-Group-Id", *envelope.group_id);
    }
    return headers;
}

DeliveryResult DeliveryDispatcher::deliver(const core::AgentConnection& connection,
                                           const DeliveryEnvelope& envelope) {
    auto response = http_.post(connection.callback_url, envelope.body,
                               build_headers(connection, envelope), options_.timeout_ms);

    if (!response.is_success()) {
        std::string error = response.error.empty()
            ? "Callback returned " + std::to_string(response.status)
            : response.error;
        spdlog::warn("Delivery {} to connection {} failed: {}",
                     envelope.target.key(), connection.id, error);
        return record_failure(connection, envelope, response.status, error);
    }

    const auto now = clock_.now();
    queue_.remove(envelope.target);
    if (!ledger_.mark_delivered(envelope.target, now)) {
        spdlog::debug("Delivery {} already settled", envelope.target.key());
    }
    connections_.touch_last_seen(connection.id, now);
    settle_parent(envelope.target);

    spdlog::debug("Delivered {} to connection {}", envelope.target.key(), connection.id);

    DeliveryResult result;
    result.success = true;
    result.status = MessageStatus::DELIVERED;
    result.http_status = response.status;
    return result;
}

DeliveryResult DeliveryDispatcher::record_failure(const core::AgentConnection& connection,
                                                  const DeliveryEnvelope& envelope,
                                                  int http_status,
                                                  const std::string& error) {
    DeliveryResult result;
    result.http_status = http_status;
    result.error = error;

    auto retry_count = ledger_.increment_retry_count(envelope.target);
    if (!retry_count) {
        // Row vanished or a concurrent writer already settled it
        queue_.remove(envelope.target);
        result.status = MessageStatus::FAILED;
        return result;
    }

    if (*retry_count > options_.max_retries) {
        spdlog::warn("Delivery {} exhausted {} retries", envelope.target.key(), options_.max_retries);
        fail(envelope.target, "Max retries exceeded");
        result.status = MessageStatus::FAILED;
        return result;
    }

    RetryTask task;
    task.envelope = envelope;
    task.connection_id = connection.id;
    task.retry_count = *retry_count;
    task.next_at = clock_.now() + backoff_delay(*retry_count);
    queue_.upsert(task);

    result.status = MessageStatus::PENDING;
    return result;
}

void DeliveryDispatcher::fail(const DeliveryTarget& target, const std::string& reason) {
    queue_.remove(target);
    if (ledger_.mark_failed(target, reason)) {
        spdlog::warn("Delivery {} failed: {}", target.key(), reason);
    }
    settle_parent(target);
}

void DeliveryDispatcher::settle_parent(const DeliveryTarget& target) {
    if (target.kind != TargetKind::DELIVERY) {
        return;
    }

    auto counts = core::count_deliveries(ledger_.deliveries_for(target.message_id));
    auto status = core::aggregate_status(counts);
    if (status == MessageStatus::PENDING) {
        return;
    }

    std::optional<core::TimePoint> delivered_at;
    if (status == MessageStatus::DELIVERED) {
        delivered_at = clock_.now();
    }
    if (ledger_.settle_message(target.message_id, status, delivered_at)) {
        spdlog::info("Group message {} settled as {} ({}/{} delivered)",
                     target.message_id, core::to_string(status), counts.delivered, counts.recipients);
    }
}

} // namespace mahilo::delivery
