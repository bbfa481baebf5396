/**
 * @file broker_client.hpp
 * @brief 券商 WebSocket 客户端
 *
 * 对外的统一入口：连接管理、行情订阅、下单撤单、查询，以及推送回调注册。
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "client/client_options.hpp"
#include "core/transport.hpp"
#include "session/correlation_table.hpp"
#include "session/event_dispatcher.hpp"
#include "session/lifecycle_manager.hpp"
#include "session/session_types.hpp"
#include "session/subscription_registry.hpp"

namespace ironlink {

/**
 * @struct ConnectionStats
 * @brief 连接状态快照
 */
struct ConnectionStats {
    bool connected = false;                  ///< 会话处于 READY
    int reconnect_attempts = 0;              ///< 当前这一轮已失败的连接尝试
    size_t active_subscription_count = 0;
    size_t pending_request_count = 0;
    ConnectionState state = ConnectionState::DISCONNECTED;
    std::vector<std::string> subscriptions;  ///< 当前订阅的合约
    std::vector<std::string> pending_request_ids;  ///< 在途请求的关联 ID
};

/**
 * @class BrokerClient
 * @brief 券商 WebSocket 客户端
 *
 * 所有请求类接口都是阻塞的，返回 RequestOutcome，运行期失败不抛异常。
 * 可从多个线程并发调用；每个调用只阻塞自己，最迟在超时时返回。
 *
 * @par 使用示例
 * @code
 * BrokerClient client(ClientOptions::from_config(Config::instance()));
 * client.on_market_data([](const InboundEvent& e) {
 *     LOG() << "tick " << e.data.dump();
 * });
 * if (client.connect()) {
 *     client.subscribe("MES");
 *
 *     OrderSpec order;
 *     order.symbol = "MES";
 *     order.side = Side::BUY;
 *     order.quantity = 2;
 *     RequestOutcome outcome = client.place_order(order);
 * }
 * @endcode
 *
 * @warning 不要在推送回调或状态回调中调用请求类接口，也不要在其中销毁客户端
 */
class BrokerClient {
public:
    /**
     * @brief 构造客户端（不会立即连接）
     * @param options 客户端参数
     * @param factory 传输层工厂；为空时使用 WebSocketTransport
     * @throws std::invalid_argument 地址或参数非法
     */
    explicit BrokerClient(ClientOptions options, TransportFactory factory = TransportFactory());

    ~BrokerClient();

    BrokerClient(const BrokerClient&) = delete;
    BrokerClient& operator=(const BrokerClient&) = delete;

    /// @name 连接管理
    /// @{

    /**
     * @brief 连接并认证，失败时按重连策略重试
     * @return true 会话就绪
     */
    bool connect();

    /**
     * @brief 断开连接，取消所有在途请求
     */
    void disconnect();

    ConnectionState state() const;

    bool is_connected() const { return state() == ConnectionState::READY; }

    /**
     * @brief 等待会话就绪（例如断线重连期间）
     */
    bool wait_until_ready(std::chrono::milliseconds timeout) const;

    ConnectionStats get_connection_stats() const;
    /// @}

    /// @name 请求
    /// @{

    /**
     * @brief 订阅行情
     * @return RequestOutcome 已订阅时返回 ALREADY_SUBSCRIBED，不发送请求
     */
    RequestOutcome subscribe(const std::string& symbol,
                             std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief 退订行情
     * @return RequestOutcome 未订阅时返回 NOT_SUBSCRIBED，不发送请求
     */
    RequestOutcome unsubscribe(const std::string& symbol,
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief 下单
     * @return RequestOutcome 参数不完整时返回 INVALID_REQUEST，不发送请求
     */
    RequestOutcome place_order(const OrderSpec& order,
                               std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    RequestOutcome cancel_order(const std::string& order_id,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    RequestOutcome query_positions(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    RequestOutcome query_account_info(std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    /// @}

    /// @name 推送回调
    /// 回调在读循环线程中执行，应尽快返回。
    /// @{
    HandlerId on_market_data(EventHandler handler);
    HandlerId on_order_update(EventHandler handler);
    HandlerId on_position_update(EventHandler handler);
    HandlerId on_error(EventHandler handler);
    bool remove_handler(HandlerId id);

    /**
     * @brief 注册状态变化回调，FAILED 状态也通过它通知
     */
    void on_state_change(StateListener listener);
    /// @}

    const ClientOptions& options() const { return options_; }

private:
    RequestOutcome simple_request(const char* action, std::chrono::milliseconds timeout);

    ClientOptions options_;
    CorrelationTable table_;
    SubscriptionRegistry registry_;
    EventDispatcher dispatcher_;
    std::unique_ptr<LifecycleManager> lifecycle_;   ///< 引用上面三者，必须最后声明
};

} // namespace ironlink
