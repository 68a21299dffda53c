#pragma once

#include "logging/LogRegistry.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sw::events {

// Fan-out of immutable snapshots. Handlers run on the publishing thread,
// outside the channel lock, so they may subscribe or unsubscribe freely.
template <typename Event>
class EventChannel {
public:
    using Handler = std::function<void(const Event&)>;
    using Token = unsigned long;

    explicit EventChannel(std::string name) : name_(std::move(name)) {}

    Token subscribe(Handler handler) {
        std::scoped_lock lock(mutex_);
        const Token token = nextToken_++;
        handlers_.emplace(token, std::move(handler));
        return token;
    }

    bool unsubscribe(const Token token) {
        std::scoped_lock lock(mutex_);
        return handlers_.erase(token) > 0;
    }

    [[nodiscard]] size_t subscriberCount() const {
        std::scoped_lock lock(mutex_);
        return handlers_.size();
    }

    void publish(const Event& event) const {
        std::vector<Handler> snapshot;
        {
            std::scoped_lock lock(mutex_);
            snapshot.reserve(handlers_.size());
            for (const auto& [_, h] : handlers_) snapshot.push_back(h);
        }

        for (const auto& h : snapshot) {
            try {
                h(event);
            } catch (const std::exception& e) {
                logging::LogRegistry::monitor()->error("[{}] Subscriber threw: {}", name_, e.what());
            }
        }
    }

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::map<Token, Handler> handlers_;
    Token nextToken_{1};
};

}
