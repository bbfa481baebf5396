/**
 * @file client_options.hpp
 * @brief 客户端参数与订单描述
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "base/config.hpp"
#include "core/transport.hpp"
#include "session/lifecycle_manager.hpp"

namespace ironlink {

/**
 * @struct ClientOptions
 * @brief BrokerClient 构造参数
 *
 * @par 配置文件
 * @code
 * [broker]
 * url = wss://demo.ironbeam.com/socket
 * api_key = demo-key
 * api_secret = demo-secret
 * request_timeout_ms = 10000
 * subscribe_timeout_ms = 5000
 *
 * [reconnect]
 * max_attempts = 10
 * base_delay_ms = 5000
 * max_delay_ms = 60000
 * @endcode
 *
 * 环境变量 BASE_URL / API_KEY / API_SECRET 优先于配置文件。
 */
struct ClientOptions {
    static constexpr const char* kDefaultUrl = "wss://demo.ironbeam.com/socket";

    std::string url = kDefaultUrl;
    std::string api_key = "demo-key";
    std::string api_secret = "demo-secret";

    std::chrono::milliseconds request_timeout{10000};    ///< 下单、撤单、查询
    std::chrono::milliseconds subscribe_timeout{5000};   ///< 订阅、退订
    std::chrono::milliseconds auth_timeout{10000};
    std::chrono::milliseconds connect_timeout{10000};
    bool require_auth_ack = true;

    ReconnectPolicy reconnect;
    TransportOptions transport;   ///< connect_timeout 会覆盖其中同名字段

    /**
     * @brief 从配置读取参数，并应用环境变量覆盖
     * @param config 已加载的配置
     */
    static ClientOptions from_config(Config& config);

    /**
     * @brief 用环境变量 BASE_URL / API_KEY / API_SECRET 覆盖对应字段
     */
    void apply_environment();

    /**
     * @brief 校验参数并转换为会话参数
     * @throws std::invalid_argument 地址非法或超时参数不为正
     */
    SessionOptions to_session_options() const;
};

/// 买卖方向
enum class Side { BUY, SELL };

/// 订单类型
enum class OrderType { MARKET, LIMIT, STOP, STOP_LIMIT };

inline const char* to_string(Side side) {
    return side == Side::BUY ? "buy" : "sell";
}

inline const char* to_string(OrderType type) {
    switch (type) {
        case OrderType::MARKET:     return "market";
        case OrderType::LIMIT:      return "limit";
        case OrderType::STOP:       return "stop";
        case OrderType::STOP_LIMIT: return "stop_limit";
    }
    return "market";
}

/**
 * @struct OrderSpec
 * @brief 下单参数
 */
struct OrderSpec {
    std::string symbol;
    Side side = Side::BUY;
    OrderType type = OrderType::MARKET;
    int64_t quantity = 0;
    std::optional<double> price;         ///< LIMIT / STOP_LIMIT 必填
    std::optional<double> stop_price;    ///< STOP / STOP_LIMIT 必填
    std::optional<std::string> time_in_force;
    std::optional<std::string> client_order_id;

    /**
     * @brief 结构检查
     * @param[out] error 不合法时的原因
     * @return true 合法
     */
    bool validate(std::string& error) const;
};

} // namespace ironlink
