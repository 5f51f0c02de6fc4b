#include "router/idempotency_guard.hpp"
#include <spdlog/spdlog.h>

namespace mahilo::router {

IdempotencyGuard::IdempotencyGuard(store::MessageLedger& ledger)
    : ledger_(ledger) {}

std::optional<core::Message> IdempotencyGuard::find_prior(const std::string& sender_id,
                                                          const std::optional<std::string>& key) {
    if (!key || key->empty()) {
        return std::nullopt;
    }
    return ledger_.find_by_idempotency_key(sender_id, *key);
}

store::InsertMessageResult IdempotencyGuard::claim(const core::Message& message) {
    auto result = ledger_.insert_message(message);
    if (result.result && !result.inserted) {
        spdlog::info("Idempotency key reused by sender {}; returning message {}",
                     message.sender_user_id, result.message.id);
    }
    return result;
}

} // namespace mahilo::router
