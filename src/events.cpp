#include "launchpad/events.hpp"
#include "launchpad/chain_client.hpp"

#include <type_traits>

namespace launchpad {

LaunchId ChainEvent::launch_id() const {
    return std::visit([](const auto& e) { return e.launch_id; }, payload);
}

const char* ChainEvent::type_name() const {
    return std::visit([](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TokenCreated>) return "TokenCreated";
        else if constexpr (std::is_same_v<T, TokenPurchase>) return "TokenPurchase";
        else if constexpr (std::is_same_v<T, TokenSale>) return "TokenSale";
        else return "CurveMigrationTriggered";
    }, payload);
}

// =============================================================================
// QueueEventSource
// =============================================================================

QueueEventSource::QueueEventSource(ChainId chain_id) : chain_id_(chain_id) {}

std::optional<ChainEvent> QueueEventSource::next(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });

    if (queue_.empty()) return std::nullopt;

    ChainEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

bool QueueEventSource::closed() const {
    std::lock_guard lock(mutex_);
    return closed_ && queue_.empty();
}

void QueueEventSource::push(ChainEvent event) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

void QueueEventSource::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

size_t QueueEventSource::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

} // namespace launchpad
