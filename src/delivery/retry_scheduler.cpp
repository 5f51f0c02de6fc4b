#include "delivery/retry_scheduler.hpp"
#include <spdlog/spdlog.h>

namespace mahilo::delivery {

RetryScheduler::RetryScheduler(RetryQueue& queue,
                               DeliveryDispatcher& dispatcher,
                               store::ConnectionRegistry& connections,
                               util::Clock& clock)
    : queue_(queue)
    , dispatcher_(dispatcher)
    , connections_(connections)
    , clock_(clock) {}

TickStats RetryScheduler::process_due() {
    TickStats stats;

    for (const auto& task : queue_.due(clock_.now())) {
        auto connection = connections_.find_connection(task.connection_id);
        if (!connection || !connection->is_active()) {
            dispatcher_.fail(task.envelope.target, "Connection not found");
            ++stats.failed;
            continue;
        }

        ++stats.attempted;
        auto result = dispatcher_.deliver(*connection, task.envelope);
        if (result.success) {
            ++stats.delivered;
        } else if (result.status == core::MessageStatus::PENDING) {
            ++stats.rescheduled;
        } else {
            ++stats.failed;
        }
    }

    if (stats.attempted > 0 || stats.failed > 0) {
        spdlog::debug("Retry tick: attempted={} delivered={} rescheduled={} failed={}",
                      stats.attempted, stats.delivered, stats.rescheduled, stats.failed);
    }
    return stats;
}

} // namespace mahilo::delivery
