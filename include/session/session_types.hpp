/**
 * @file session_types.hpp
 * @brief 会话层公共类型：连接状态、请求结果
 */

#pragma once

#include <string>
#include <utility>

#include "protocol/wire_message.hpp"

namespace ironlink {

/**
 * @enum ConnectionState
 * @brief 会话连接状态
 *
 * @code
 * DISCONNECTED -> CONNECTING -> AUTHENTICATING -> READY
 * READY --(连接丢失)--> DISCONNECTED -> RECONNECTING -> CONNECTING -> ...
 * RECONNECTING --(超过重试上限)--> FAILED
 * @endcode
 *
 * 只有 READY 状态允许发送调用方请求；FAILED 需要显式 connect() 才会再次尝试。
 */
enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    AUTHENTICATING,
    READY,
    RECONNECTING,
    FAILED
};

/**
 * @brief 获取连接状态名称
 */
inline const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED:   return "Disconnected";
        case ConnectionState::CONNECTING:     return "Connecting";
        case ConnectionState::AUTHENTICATING: return "Authenticating";
        case ConnectionState::READY:          return "Ready";
        case ConnectionState::RECONNECTING:   return "Reconnecting";
        case ConnectionState::FAILED:         return "Failed";
    }
    return "Unknown";
}

/**
 * @enum RequestStatus
 * @brief 单次请求的结果分类
 */
enum class RequestStatus {
    OK,                 ///< 券商已确认
    ALREADY_SUBSCRIBED, ///< 订阅已存在，未发出请求
    NOT_SUBSCRIBED,     ///< 未订阅该合约，未发出请求
    REJECTED,           ///< 券商返回错误/拒绝
    TIMEOUT,            ///< 超过截止时间仍未收到响应
    CONNECTION_LOST,    ///< 等待期间连接断开
    SHUTTING_DOWN,      ///< 客户端正在关闭
    NOT_CONNECTED,      ///< 会话不处于 READY 状态
    INVALID_REQUEST     ///< 请求参数不完整，未发出请求
};

/**
 * @brief 获取请求结果名称
 */
inline const char* to_string(RequestStatus status) {
    switch (status) {
        case RequestStatus::OK:                 return "ok";
        case RequestStatus::ALREADY_SUBSCRIBED: return "already_subscribed";
        case RequestStatus::NOT_SUBSCRIBED:     return "not_subscribed";
        case RequestStatus::REJECTED:           return "rejected";
        case RequestStatus::TIMEOUT:            return "timeout";
        case RequestStatus::CONNECTION_LOST:    return "connection_lost";
        case RequestStatus::SHUTTING_DOWN:      return "shutting_down";
        case RequestStatus::NOT_CONNECTED:      return "not_connected";
        case RequestStatus::INVALID_REQUEST:    return "invalid_request";
    }
    return "unknown";
}

/**
 * @struct RequestOutcome
 * @brief 请求的最终结果
 *
 * 请求相关的失败都以结果返回给调用方，不抛出异常。
 * response 仅在收到券商响应时有效（OK 或 REJECTED）。
 */
struct RequestOutcome {
    RequestStatus status = RequestStatus::NOT_CONNECTED;
    WireMessage response;   ///< 券商响应报文
    std::string message;    ///< 失败原因或券商说明

    RequestOutcome() = default;
    RequestOutcome(RequestStatus s, std::string msg)
        : status(s), message(std::move(msg)) {}
    RequestOutcome(RequestStatus s, WireMessage resp, std::string msg)
        : status(s), response(std::move(resp)), message(std::move(msg)) {}

    /**
     * @brief 是否成功（OK 或幂等的 ALREADY_SUBSCRIBED）
     */
    bool ok() const {
        return status == RequestStatus::OK || status == RequestStatus::ALREADY_SUBSCRIBED;
    }
};

} // namespace ironlink
