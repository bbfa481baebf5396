/**
 * @file event_dispatcher.hpp
 * @brief 推送事件分发器
 *
 * 把券商主动推送的消息（行情、委托回报、持仓变化、错误通知）
 * 按事件类别分发给已注册的回调。
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "protocol/wire_message.hpp"

namespace ironlink {

/**
 * @enum EventKind
 * @brief 推送事件类别
 */
enum class EventKind {
    MARKET_DATA,
    ORDER_UPDATE,
    POSITION_UPDATE,
    ERROR
};

inline const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::MARKET_DATA:     return "market_data";
        case EventKind::ORDER_UPDATE:    return "order_update";
        case EventKind::POSITION_UPDATE: return "position_update";
        case EventKind::ERROR:           return "error";
    }
    return "unknown";
}

/**
 * @struct InboundEvent
 * @brief 一条解码后的推送消息
 *
 * 每条消息构造一次，分发完即丢弃。
 */
struct InboundEvent {
    EventKind kind = EventKind::MARKET_DATA;
    std::string type;       ///< 原始 type 字段
    nlohmann::json data;    ///< 业务载荷
    std::string message;    ///< 说明文字（错误通知）

    /**
     * @brief 从推送报文构造事件
     * @param msg 推送报文
     * @param[out] event 构造出的事件
     * @return true 属于已知的推送类别
     * @return false type 缺失或无法识别
     */
    static bool from_message(const WireMessage& msg, InboundEvent& event);
};

/// 事件回调
using EventHandler = std::function<void(const InboundEvent& event)>;

/// 回调注册凭据，用于注销
using HandlerId = uint64_t;

/**
 * @class EventDispatcher
 * @brief 按事件类别分发推送消息
 *
 * @par 线程模型
 * - register_handler / unregister_handler 可在任意线程调用
 * - dispatch 在读循环线程中调用，回调也在该线程执行
 * - 回调在锁外执行，回调内部可以再注册或注销回调
 *
 * @par 异常隔离
 * 单个回调抛出的异常被捕获并记录日志，不影响其他回调，也不会中断读循环。
 */
class EventDispatcher {
public:
    EventDispatcher() = default;
    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    /**
     * @brief 注册回调
     * @param kind 事件类别
     * @param handler 回调函数
     * @return HandlerId 注册凭据；handler 为空时返回 0
     */
    HandlerId register_handler(EventKind kind, EventHandler handler);

    /**
     * @brief 注销回调
     * @return true 找到并移除
     */
    bool unregister_handler(HandlerId id);

    /**
     * @brief 分发事件给该类别的所有回调
     * @return size_t 被调用的回调数量（含抛出异常的回调）
     */
    size_t dispatch(const InboundEvent& event);

    /**
     * @brief 某类别当前的回调数量
     */
    size_t handler_count(EventKind kind) const;

private:
    struct Entry {
        HandlerId id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::map<EventKind, std::vector<Entry>> handlers_;
    HandlerId next_id_ = 1;
};

} // namespace ironlink
