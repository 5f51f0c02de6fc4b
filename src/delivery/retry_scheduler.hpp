#pragma once
#include "delivery/dispatcher.hpp"
#include "delivery/retry_queue.hpp"
#include "store/store.hpp"
#include "util/clock.hpp"

namespace mahilo::delivery {

struct TickStats {
    int attempted = 0;
    int delivered = 0;
    int rescheduled = 0;
    int failed = 0;
};

// Drives outstanding retries. process_due() is called from a periodic
// tick; each due task gets one attempt through the dispatcher.
class RetryScheduler {
public:
    RetryScheduler(RetryQueue& queue,
                   DeliveryDispatcher& dispatcher,
                   store::ConnectionRegistry& connections,
                   util::Clock& clock);

    // Non-copyable
    RetryScheduler(const RetryScheduler&) = delete;
    RetryScheduler& operator=(const RetryScheduler&) = delete;

    TickStats process_due();

private:
    RetryQueue& queue_;
    DeliveryDispatcher& dispatcher_;
    store::ConnectionRegistry& connections_;
    util::Clock& clock_;
};

} // namespace mahilo::delivery
