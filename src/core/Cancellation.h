#ifndef EARMARK_CANCELLATION_H
#define EARMARK_CANCELLATION_H

#include <atomic>

namespace Earmark {

// Shared flag polled between per-hash (match) or per-track (ingest) iterations
class CancellationToken {
private:
    std::atomic<bool> cancelled{false};

public:
    void cancel() { cancelled.store(true, std::memory_order_relaxed); }
    void reset() { cancelled.store(false, std::memory_order_relaxed); }
    bool isCancelled() const { return cancelled.load(std::memory_order_relaxed); }
};

inline bool isCancelled(const CancellationToken* token) {
    return token != nullptr && token->isCancelled();
}

} // namespace Earmark

#endif
