#pragma once

#include <mutex>
#include <set>
#include <string>

namespace sw::lifecycle {

// At most one operation per service id. Shared by the orchestrator and the baseline monitor.
class InFlightRegistry {
public:
    class Lease {
    public:
        Lease() = default;
        ~Lease() { release(); }

        Lease(Lease&& other) noexcept : registry_(other.registry_), id_(std::move(other.id_)) {
            other.registry_ = nullptr;
        }

        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                release();
                registry_ = other.registry_;
                id_ = std::move(other.id_);
                other.registry_ = nullptr;
            }
            return *this;
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        explicit operator bool() const { return registry_ != nullptr; }

        void release() {
            if (registry_) registry_->release(id_);
            registry_ = nullptr;
        }

    private:
        friend class InFlightRegistry;
        Lease(InFlightRegistry* registry, std::string id) : registry_(registry), id_(std::move(id)) {}

        InFlightRegistry* registry_{nullptr};
        std::string id_;
    };

    // Empty lease when another operation already holds the id
    [[nodiscard]] Lease tryAcquire(const std::string& id) {
        std::scoped_lock lock(mutex_);
        if (!busy_.insert(id).second) return {};
        return {this, id};
    }

    [[nodiscard]] bool isBusy(const std::string& id) const {
        std::scoped_lock lock(mutex_);
        return busy_.contains(id);
    }

    [[nodiscard]] size_t busyCount() const {
        std::scoped_lock lock(mutex_);
        return busy_.size();
    }

private:
    mutable std::mutex mutex_;
    std::set<std::string> busy_;

    void release(const std::string& id) {
        std::scoped_lock lock(mutex_);
        busy_.erase(id);
    }
};

}
