#include "orthoedge/core/IdGenerator.h"

#include <atomic>
#include <cstdint>

namespace orthoedge::ids {

namespace {
std::atomic<uint64_t> pointCounter{0};
std::atomic<uint64_t> dragCounter{0};
}  // namespace

std::string nextPointId() {
    return "pt-" + std::to_string(pointCounter.fetch_add(1, std::memory_order_relaxed) + 1);
}

std::string nextDragId() {
    return "drag-" + std::to_string(dragCounter.fetch_add(1, std::memory_order_relaxed) + 1);
}

}  // namespace orthoedge::ids
