#include "delivery/retry_queue.hpp"
#include <algorithm>

namespace mahilo::delivery {

void RetryQueue::upsert(const RetryTask& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_[task.envelope.target.key()] = task;
}

bool RetryQueue::remove(const core::DeliveryTarget& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.erase(target.key()) > 0;
}

std::optional<RetryTask> RetryQueue::find(const core::DeliveryTarget& target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(target.key());
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<RetryTask> RetryQueue::due(core::TimePoint now) const {
    std::vector<RetryTask> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, task] : tasks_) {
            if (task.next_at <= now) {
                out.push_back(task);
            }
        }
    }
    std::sort(out.begin(), out.end(), [](const RetryTask& a, const RetryTask& b) {
        return a.next_at < b.next_at;
    });
    return out;
}

std::size_t RetryQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

std::size_t RetryQueue::size(core::TargetKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(tasks_.begin(), tasks_.end(),
        [kind](const auto& entry) { return entry.second.envelope.target.kind == kind; }));
}

} // namespace mahilo::delivery
