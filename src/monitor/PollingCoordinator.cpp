#include "monitor/PollingCoordinator.hpp"
#include "monitor/StatusQueryTask.hpp"
#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

#include <future>
#include <vector>

using namespace sw::monitor;
using namespace sw::concurrency;
using namespace sw::types;
using namespace sw::logging;
using namespace std::chrono;

PollingCoordinator::PollingCoordinator(std::shared_ptr<host::ServiceHostAdapter> adapter, Options options)
    : AsyncService("PollingCoordinator"),
      adapter_(std::move(adapter)),
      options_(options),
      pool_(std::make_unique<ThreadPool>("status-query", options.max_concurrent_queries)) {
    if (!adapter_) throw std::invalid_argument("PollingCoordinator requires a host adapter");
}

PollingCoordinator::~PollingCoordinator() {
    stop();
    pool_->stop();
}

std::optional<milliseconds> PollingCoordinator::intervalFor(const size_t pending) {
    if (pending == 0) return std::nullopt;
    if (pending == 1) return milliseconds(500);
    if (pending <= 3) return milliseconds(1000);
    if (pending <= 5) return milliseconds(1500);
    return milliseconds(2000);
}

void PollingCoordinator::recomputeLocked() {
    interval_ = intervalFor(pending_.size());
}

void PollingCoordinator::trackService(const std::string& id) {
    bool armed;
    {
        std::scoped_lock lock(mutex_);
        const bool wasIdle = pending_.empty();
        pending_[id] = steady_clock::now();
        recomputeLocked();
        armed = wasIdle;
    }

    if (armed) {
        LogRegistry::monitor()->debug("[PollingCoordinator] Timer armed for {}", id);
        wake();
    }
}

bool PollingCoordinator::isTimerActive() const {
    std::scoped_lock lock(mutex_);
    return interval_.has_value();
}

std::optional<milliseconds> PollingCoordinator::currentInterval() const {
    std::scoped_lock lock(mutex_);
    return interval_;
}

size_t PollingCoordinator::pendingCount() const {
    std::scoped_lock lock(mutex_);
    return pending_.size();
}

bool PollingCoordinator::isTracking(const std::string& id) const {
    std::scoped_lock lock(mutex_);
    return pending_.contains(id);
}

void PollingCoordinator::tickOnce() {
    std::scoped_lock tickLock(tickMutex_);

    std::map<std::string, steady_clock::time_point> snapshot;
    {
        std::scoped_lock lock(mutex_);
        snapshot = pending_;
    }
    if (snapshot.empty() || pool_->isStopped()) return;

    // The pool's worker count bounds how many queries run at once
    std::vector<std::pair<std::string, std::future<ServiceStatus>>> inflight;
    inflight.reserve(snapshot.size());
    for (const auto& [id, _] : snapshot) {
        auto task = std::make_shared<StatusQueryTask>(adapter_, id);
        auto future = task->getFuture();
        try {
            pool_->submit(task);
        } catch (const std::exception& e) {
            LogRegistry::monitor()->warn("[PollingCoordinator] Tick abandoned: {}", e.what());
            return;
        }
        inflight.emplace_back(id, std::move(future));
    }

    StatusBatch batch;
    for (auto& [id, future] : inflight) {
        try {
            batch.status_updates[id] = future.get();
        } catch (const std::exception& e) {
            LogRegistry::monitor()->warn("[PollingCoordinator] Query for {} failed: {}", id, e.what());
            batch.status_updates[id] = ServiceStatus::Error;
        }
    }

    {
        std::scoped_lock lock(mutex_);
        const auto now = steady_clock::now();
        for (const auto& [id, status] : batch.status_updates) {
            const auto it = pending_.find(id);
            // Re-tracked during this tick: keep the fresh entry
            if (it == pending_.end() || it->second != snapshot.at(id)) continue;

            const bool expired = now - it->second >= options_.max_tracked;
            if (!isTransitioning(status) || expired) {
                if (expired && isTransitioning(status))
                    LogRegistry::monitor()->warn("[PollingCoordinator] {} still {} after {} ms, untracking",
                                                 id, to_string(status), options_.max_tracked.count());
                pending_.erase(it);
            }
        }
        recomputeLocked();
    }

    events_.publish(batch);
}

void PollingCoordinator::runLoop() {
    while (!shouldStop()) {
        const auto interval = currentInterval();
        if (!interval) {
            idleUntilWoken();
            continue;
        }

        lazySleep(*interval);
        if (shouldStop()) break;

        try {
            tickOnce();
        } catch (const std::exception& e) {
            LogRegistry::monitor()->error("[PollingCoordinator] Tick failed: {}", e.what());
        }
    }
}
