/**
 * @file wire_fields.hpp
 * @brief 券商 WebSocket 协议字段与消息类型定义
 *
 * 报文为 JSON 文本帧。请求以 "action" 区分，入站消息以 "type" 区分，
 * 请求与响应通过 "request_id" 关联。
 */

#pragma once

namespace ironlink {

/**
 * @namespace fields
 * @brief 报文字段名常量
 *
 * 请求格式：{"action": ..., "request_id": ..., <业务字段>, "timestamp": ...}
 * 入站格式：{"type": ..., "request_id": ..., "status": ..., "message": ..., "data": {...}}
 */
namespace fields {

// ============================================================================
// 公共字段
// ============================================================================

/// @brief 请求动作（出站消息类型判别字段）
constexpr const char* Action = "action";

/// @brief 入站消息类型（响应与推送的判别字段）
constexpr const char* Type = "type";

/// @brief 关联 ID，响应会原样带回
constexpr const char* RequestId = "request_id";

/// @brief 发送时间（ISO-8601 UTC）
constexpr const char* Timestamp = "timestamp";

/// @brief 处理结果（"ok" / "error" / "rejected" 等）
constexpr const char* Status = "status";

/// @brief 人类可读的说明或错误原因
constexpr const char* Message = "message";

/// @brief 推送或响应的业务载荷
constexpr const char* Data = "data";

// ============================================================================
// 认证字段
// ============================================================================

constexpr const char* ApiKey = "api_key";
constexpr const char* Secret = "secret";

// ============================================================================
// 业务字段
// ============================================================================

constexpr const char* Symbol = "symbol";
constexpr const char* Side = "side";
constexpr const char* OrderType = "order_type";
constexpr const char* Quantity = "quantity";
constexpr const char* Price = "price";
constexpr const char* StopPrice = "stop_price";
constexpr const char* TimeInForce = "time_in_force";
constexpr const char* ClientOrderId = "client_order_id";
constexpr const char* OrderId = "order_id";

} // namespace fields

/**
 * @namespace actions
 * @brief 出站请求动作
 */
namespace actions {

constexpr const char* Authenticate = "authenticate";
constexpr const char* Subscribe = "subscribe";
constexpr const char* Unsubscribe = "unsubscribe";
constexpr const char* PlaceOrder = "place_order";
constexpr const char* CancelOrder = "cancel_order";
constexpr const char* GetPositions = "get_positions";
constexpr const char* GetAccountInfo = "get_account_info";

} // namespace actions

/**
 * @namespace types
 * @brief 入站推送消息类型
 */
namespace types {

constexpr const char* MarketData = "market_data";
constexpr const char* OrderUpdate = "order_update";
constexpr const char* PositionUpdate = "position_update";
constexpr const char* Error = "error";

} // namespace types

} // namespace ironlink
