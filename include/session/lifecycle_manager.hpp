/**
 * @file lifecycle_manager.hpp
 * @brief 会话生命周期管理
 *
 * 驱动 连接 -> 认证 -> 就绪 ->（断线）重连退避 -> 就绪 的状态机，
 * 并负责请求的发送、响应关联、推送分发和有序关闭。
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "base/thread_pool.hpp"
#include "core/endpoint.hpp"
#include "core/transport.hpp"
#include "protocol/request_id.hpp"
#include "protocol/wire_message.hpp"
#include "session/correlation_table.hpp"
#include "session/event_dispatcher.hpp"
#include "session/session_types.hpp"
#include "session/subscription_registry.hpp"

namespace ironlink {

/**
 * @struct ReconnectPolicy
 * @brief 重连策略：线性递增退避，有上限，有最大次数
 *
 * 第 n 次失败后等待 min(base_delay * n, max_delay)。
 */
struct ReconnectPolicy {
    int max_attempts = 10;
    std::chrono::milliseconds base_delay{5000};
    std::chrono::milliseconds max_delay{60000};

    std::chrono::milliseconds delay_for(int attempt) const {
        if (attempt < 1) attempt = 1;
        return std::min(base_delay * attempt, max_delay);
    }
};

/**
 * @struct SessionOptions
 * @brief 会话参数
 */
struct SessionOptions {
    Endpoint endpoint;
    std::string api_key;
    std::string api_secret;
    std::chrono::milliseconds auth_timeout{10000};
    std::chrono::milliseconds subscribe_timeout{5000};  ///< 重连后重新订阅使用的超时
    bool require_auth_ack = true;   ///< 是否等待券商确认认证
    ReconnectPolicy reconnect;
};

/// 状态变化回调：新状态与原因
using StateListener = std::function<void(ConnectionState state, const std::string& reason)>;

/**
 * @class LifecycleManager
 * @brief 会话状态机与请求通道
 *
 * @par 线程模型
 * - 连接、重连退避、重新订阅、拆除连接都派发到单线程的 lifecycle_ 线程池串行执行，
 *   因此任何时刻最多只有一个连接/重连循环
 * - 读循环回调（on_frame / on_transport_closed）在传输层的 I/O 线程中执行，
 *   只做解码、关联、分发，不阻塞
 * - request() 可在任意调用方线程并发调用，只阻塞调用方自己
 * - 所有发送都在 session_mutex_ 下交给传输层，保证单写者
 *
 * @par 断线处理
 * 连接离开 READY 状态时，关联表中所有在途请求以 CONNECTION_LOST 失败；
 * 若未请求关闭，随即在生命周期线程上启动重连循环，重连成功后重新订阅登记表中的全部合约。
 *
 * @par 使用示例
 * @code
 * LifecycleManager lifecycle(options, factory, table, registry, dispatcher);
 * if (lifecycle.connect()) {
 *     WireMessage msg;
 *     msg.set(fields::Action, actions::GetPositions);
 *     RequestOutcome outcome = lifecycle.request(msg, std::chrono::seconds(10));
 * }
 * lifecycle.disconnect();
 * @endcode
 */
class LifecycleManager {
public:
    /**
     * @brief 构造生命周期管理器
     * @param options 会话参数
     * @param factory 传输层工厂，每次连接尝试调用一次
     * @param table 关联表（生命周期须长于本对象）
     * @param registry 订阅登记表（生命周期须长于本对象）
     * @param dispatcher 推送分发器（生命周期须长于本对象）
     * @throws std::invalid_argument factory 为空或重连参数非法
     */
    LifecycleManager(SessionOptions options, TransportFactory factory,
                     CorrelationTable& table, SubscriptionRegistry& registry,
                     EventDispatcher& dispatcher);

    /**
     * @brief 析构时断开连接并停止生命周期线程
     */
    ~LifecycleManager();

    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    /**
     * @brief 建立会话（失败时按重连策略重试）
     * @return true 会话已就绪
     * @return false 重试次数耗尽（状态为 FAILED）或期间调用了 disconnect()
     *
     * 已就绪时直接返回 true。FAILED 状态下调用会重新开始一轮尝试。
     */
    bool connect();

    /**
     * @brief 断开会话
     *
     * 幂等。停止重连、以 SHUTTING_DOWN 失败所有在途请求、关闭连接、清空订阅登记表。
     * 在事件回调中调用时只发起断开，不等待完成。
     */
    void disconnect();

    /**
     * @brief 发送请求并等待响应
     * @param msg 请求报文（request_id 与 timestamp 自动填充）
     * @param timeout 超时时长
     * @param[out] generation 非空时写入发送该请求的连接代数
     * @return RequestOutcome 请求结果；会话未就绪时返回 NOT_CONNECTED
     *
     * 就绪检查与写入在同一临界区内完成，请求不会在认证完成前发到新连接上。
     */
    RequestOutcome request(WireMessage msg, std::chrono::milliseconds timeout,
                           uint64_t* generation = nullptr);

    /**
     * @brief 把已被券商确认的订阅记入登记表
     * @param symbol 合约
     * @param generation 确认该订阅的连接代数（来自 request()）
     * @return false 会话已被关闭或已进入 FAILED，订阅未记录
     *
     * 确认之后连接已被替换、且新连接的重新订阅已经开始时，
     * 在生命周期线程上为该合约补发一次订阅。
     */
    bool commit_subscription(const std::string& symbol, uint64_t generation);

    ConnectionState state() const;

    /**
     * @brief 等待进入指定状态
     * @return true 在超时前进入了该状态
     */
    bool wait_for_state(ConnectionState target, std::chrono::milliseconds timeout) const;

    /**
     * @brief 当前这一轮连接已失败的尝试次数（就绪后归零）
     */
    int reconnect_attempts() const { return attempts_.load(); }

    /**
     * @brief 设置状态变化回调
     *
     * 回调在发生状态变化的线程（生命周期线程或 I/O 线程）中调用，
     * 不得在回调中阻塞等待请求结果。在 I/O 线程上调用 disconnect() 只发起断开，
     * 调用 connect() 会被拒绝。
     */
    void set_state_listener(StateListener listener);

    const SessionOptions& options() const { return options_; }

private:
    /// 连接/重连循环（生命周期线程）
    bool run_connect_loop(bool reconnecting);

    /// 单次连接 + 认证尝试（生命周期线程）
    bool try_connect_once(std::string& failure);

    bool authenticate(std::string& failure);

    /// 重新订阅登记表中的全部合约（生命周期线程）
    void resubscribe_all();

    /// 重新订阅单个合约；会话不再就绪时返回 false（生命周期线程）
    bool resubscribe(const std::string& symbol);

    /// 仅当当前连接仍然可用且未记录断线时进入 READY
    bool enter_ready(const std::string& reason);

    /// 关闭并释放当前传输层（生命周期线程）
    void release_transport();

    /// 拆除会话（生命周期线程）
    void teardown();

    /// 请求通道；require_ready 为 true 时发送前在锁内确认会话处于 READY
    RequestOutcome exchange(WireMessage msg, std::chrono::milliseconds timeout,
                            bool require_ready, uint64_t* generation);

    /// @return OK 已交给传输层；否则为应记入请求结果的失败状态
    RequestStatus send_frame(const std::string& frame, bool require_ready, uint64_t* generation);

    void set_state(ConnectionState next, const std::string& reason);

    /// 唤醒状态等待者，记录日志并通知状态回调（不持有 session_mutex_）
    void announce(ConnectionState previous, ConnectionState next, const std::string& reason);

    /// I/O 线程回调
    void on_frame(uint64_t generation, const std::string& frame);
    void on_transport_closed(uint64_t generation, const std::string& reason);

    SessionOptions options_;
    TransportFactory factory_;
    CorrelationTable& table_;
    SubscriptionRegistry& registry_;
    EventDispatcher& dispatcher_;
    MessageCodec codec_;
    RequestIdGenerator ids_;

    mutable std::mutex session_mutex_;          ///< 保护 state_ / transport_ / 各连接代数
    mutable std::condition_variable state_cv_;  ///< 状态变化与退避等待
    ConnectionState state_ = ConnectionState::DISCONNECTED;
    std::unique_ptr<Transport> transport_;
    uint64_t generation_ = 0;                   ///< 每次连接尝试递增，用于丢弃过期回调
    uint64_t lost_generation_ = 0;              ///< 最近一次报告断线的连接代数
    uint64_t snapshot_generation_ = 0;          ///< 最近一次取重新订阅快照时的连接代数

    std::atomic<int> attempts_{0};
    std::atomic<bool> stop_requested_{false};

    std::mutex listener_mutex_;
    StateListener listener_;

    ThreadPool lifecycle_{1};   ///< 最后声明，最先析构
};

} // namespace ironlink
