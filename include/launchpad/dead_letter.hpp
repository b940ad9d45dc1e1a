#ifndef LAUNCHPAD_DEAD_LETTER_HPP
#define LAUNCHPAD_DEAD_LETTER_HPP

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chain_client.hpp"
#include "types.hpp"

namespace launchpad {

// =============================================================================
// Dead Letters - fan-out legs that exhausted their retries
// =============================================================================

enum class LegKind : uint8_t {
    Deploy = 0,
    SyncPrice = 1,
    Migrate = 2
};

const char* to_string(LegKind kind);

struct DeadLetter {
    uint64_t id;
    LegKind kind;
    CurveKey key;              // destination chain of the leg
    uint32_t attempts;
    std::string last_error;
    uint64_t parked_at;
    std::optional<DeployRequest> deploy;   // Deploy legs
    std::optional<PriceSync> sync;         // SyncPrice legs
};

class DeadLetterQueue {
public:
    DeadLetterQueue() = default;

    DeadLetterQueue(const DeadLetterQueue&) = delete;
    DeadLetterQueue& operator=(const DeadLetterQueue&) = delete;

    // Assigns id and parked_at; returns the id
    uint64_t park(DeadLetter letter);

    // Removes and returns every parked leg, oldest first
    std::vector<DeadLetter> drain();

    std::vector<DeadLetter> list() const;
    size_t size() const;
    bool empty() const { return size() == 0; }

    // Legs parked since construction, including drained ones
    uint64_t total_parked() const;

private:
    std::deque<DeadLetter> letters_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;
};

} // namespace launchpad

#endif // LAUNCHPAD_DEAD_LETTER_HPP
