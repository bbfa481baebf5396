/**
 * @file correlation_table.cpp
 * @brief CorrelationTable 实现
 */

#include "session/correlation_table.hpp"

#include <algorithm>

#include "base/logger.hpp"

namespace ironlink {

ResultHandle CorrelationTable::register_request(const std::string& id, Clock::duration timeout) {
    auto slot = std::make_shared<PendingRequest>(id, Clock::now() + timeout);

    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = pending_.emplace(id, slot);
    if (!inserted.second) {
        LOG_ERROR() << "[Correlation] Duplicate request id rejected: " << id;
        return nullptr;
    }
    return slot;
}

bool CorrelationTable::complete_locked(PendingRequest& slot, RequestOutcome outcome) {
    if (slot.done_) {
        return false;
    }
    slot.done_ = true;
    slot.outcome_ = std::move(outcome);
    slot.cv_.notify_all();
    return true;
}

bool CorrelationTable::resolve(const std::string& id, WireMessage response) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return false;
    }
    ResultHandle slot = it->second;
    pending_.erase(it);

    const bool rejected = response.is_rejection();
    std::string reason = response.reason();
    return complete_locked(*slot, RequestOutcome(
        rejected ? RequestStatus::REJECTED : RequestStatus::OK,
        std::move(response), std::move(reason)));
}

bool CorrelationTable::fail(const std::string& id, RequestStatus status, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return false;
    }
    ResultHandle slot = it->second;
    pending_.erase(it);
    return complete_locked(*slot, RequestOutcome(status, reason));
}

size_t CorrelationTable::fail_all(RequestStatus status, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t failed = 0;
    for (auto& entry : pending_) {
        if (complete_locked(*entry.second, RequestOutcome(status, reason))) {
            ++failed;
        }
    }
    pending_.clear();
    return failed;
}

RequestOutcome CorrelationTable::await(const ResultHandle& handle) {
    if (!handle) {
        return RequestOutcome(RequestStatus::NOT_CONNECTED, "invalid request handle");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    handle->cv_.wait_until(lock, handle->deadline_, [&handle] { return handle->done_; });

    if (!handle->done_) {
        // 截止时间到达：先移除条目，保证迟到的响应无法再命中
        auto it = pending_.find(handle->id_);
        if (it != pending_.end() && it->second == handle) {
            pending_.erase(it);
        }
        complete_locked(*handle, RequestOutcome(RequestStatus::TIMEOUT, "request " + handle->id_ + " timed out"));
    }
    return handle->outcome_;
}

size_t CorrelationTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool CorrelationTable::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) > 0;
}

std::vector<std::string> CorrelationTable::pending_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(pending_.size());
    for (const auto& entry : pending_) {
        ids.push_back(entry.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace ironlink
