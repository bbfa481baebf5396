/**
 * @file event_dispatcher.cpp
 * @brief EventDispatcher 实现
 */

#include "session/event_dispatcher.hpp"

#include <exception>

#include "base/logger.hpp"

namespace ironlink {

bool InboundEvent::from_message(const WireMessage& msg, InboundEvent& event) {
    const std::string type = msg.get_string(fields::Type, "");
    if (type == types::MarketData) {
        event.kind = EventKind::MARKET_DATA;
    } else if (type == types::OrderUpdate) {
        event.kind = EventKind::ORDER_UPDATE;
    } else if (type == types::PositionUpdate) {
        event.kind = EventKind::POSITION_UPDATE;
    } else if (type == types::Error) {
        event.kind = EventKind::ERROR;
    } else {
        return false;
    }
    event.type = type;
    event.data = msg.data();
    event.message = msg.reason();
    return true;
}

HandlerId EventDispatcher::register_handler(EventKind kind, EventHandler handler) {
    if (!handler) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const HandlerId id = next_id_++;
    handlers_[kind].push_back(Entry{id, std::move(handler)});
    return id;
}

bool EventDispatcher::unregister_handler(HandlerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& bucket : handlers_) {
        auto& entries = bucket.second;
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            if (it->id == id) {
                entries.erase(it);
                return true;
            }
        }
    }
    return false;
}

size_t EventDispatcher::dispatch(const InboundEvent& event) {
    // 复制一份回调列表后在锁外调用
    std::vector<Entry> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.kind);
        if (it == handlers_.end() || it->second.empty()) {
            LOG_DEBUG() << "[Dispatcher] No handler for " << to_string(event.kind) << " event";
            return 0;
        }
        targets = it->second;
    }

    for (const auto& entry : targets) {
        try {
            entry.handler(event);
        } catch (const std::exception& e) {
            LOG_ERROR() << "[Dispatcher] Handler " << entry.id << " for "
                        << to_string(event.kind) << " threw: " << e.what();
        } catch (...) {
            LOG_ERROR() << "[Dispatcher] Handler " << entry.id << " for "
                        << to_string(event.kind) << " threw a non-standard exception";
        }
    }
    return targets.size();
}

size_t EventDispatcher::handler_count(EventKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(kind);
    return it == handlers_.end() ? 0 : it->second.size();
}

} // namespace ironlink
