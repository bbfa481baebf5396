#include "protocol/request_id.hpp"

#include <chrono>

namespace ironlink {

RequestIdGenerator::RequestIdGenerator()
    : epoch_ms_(std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch()).count()) {}

std::string RequestIdGenerator::next() {
    const uint64_t seq = sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
    return "req_" + std::to_string(epoch_ms_) + "_" + std::to_string(seq);
}

} // namespace ironlink
