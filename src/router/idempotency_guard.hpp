#pragma once
#include <optional>
#include <string>
#include "core/types.hpp"
#include "store/store.hpp"

namespace mahilo::router {

// Duplicate-send detection scoped to (sender, idempotency key). The
// unique index behind the ledger makes the final check atomic with
// message creation.
class IdempotencyGuard {
public:
    explicit IdempotencyGuard(store::MessageLedger& ledger);

    // Prior message for this sender and key. Never matches without a key.
    std::optional<core::Message> find_prior(const std::string& sender_id,
                                            const std::optional<std::string>& key);

    // Insert the message, or return the row that won a concurrent insert
    // with the same key (inserted == false).
    store::InsertMessageResult claim(const core::Message& message);

private:
    store::MessageLedger& ledger_;
};

} // namespace mahilo::router
