#include "launchpad/dead_letter.hpp"
#include <chrono>
#include <iterator>

namespace launchpad {

const char* to_string(LegKind kind) {
    switch (kind) {
        case LegKind::Deploy: return "deploy";
        case LegKind::SyncPrice: return "sync_price";
        case LegKind::Migrate: return "migrate";
    }
    return "unknown";
}

uint64_t DeadLetterQueue::park(DeadLetter letter) {
    std::lock_guard lock(mutex_);
    letter.id = next_id_++;
    letter.parked_at = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
    uint64_t id = letter.id;
    letters_.push_back(std::move(letter));
    return id;
}

std::vector<DeadLetter> DeadLetterQueue::drain() {
    std::lock_guard lock(mutex_);
    std::vector<DeadLetter> out(std::make_move_iterator(letters_.begin()),
                                std::make_move_iterator(letters_.end()));
    letters_.clear();
    return out;
}

std::vector<DeadLetter> DeadLetterQueue::list() const {
    std::lock_guard lock(mutex_);
    return {letters_.begin(), letters_.end()};
}

size_t DeadLetterQueue::size() const {
    std::lock_guard lock(mutex_);
    return letters_.size();
}

uint64_t DeadLetterQueue::total_parked() const {
    std::lock_guard lock(mutex_);
    return next_id_ - 1;
}

} // namespace launchpad
