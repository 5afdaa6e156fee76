#pragma once

#include <atomic>

#include "cst/core/types/LabelVolume.hpp"

namespace cst {

// Monotonic instance-ID counter. IDs start at 1 after construction or reset().
// next_id() may be called from several threads; no two callers receive the
// same ID.
class IdRegistry {
public:
    IdRegistry() = default;
    IdRegistry(const IdRegistry&) = delete;
    IdRegistry& operator=(const IdRegistry&) = delete;

    Label next_id() { return last_.fetch_add(1, std::memory_order_relaxed) + 1; }

    void reset() { last_.store(0, std::memory_order_relaxed); }

    // Last issued ID, 0 if none.
    Label last() const { return last_.load(std::memory_order_relaxed); }

private:
    std::atomic<Label> last_{0};
};

} // namespace cst
