#include "session/subscription_registry.hpp"

namespace ironlink {

bool SubscriptionRegistry::add(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    return symbols_.insert(symbol).second;
}

bool SubscriptionRegistry::remove(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    return symbols_.erase(symbol) > 0;
}

bool SubscriptionRegistry::contains(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return symbols_.count(symbol) > 0;
}

std::vector<std::string> SubscriptionRegistry::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(symbols_.begin(), symbols_.end());
}

size_t SubscriptionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return symbols_.size();
}

void SubscriptionRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    symbols_.clear();
}

} // namespace ironlink
