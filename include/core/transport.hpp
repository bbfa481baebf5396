/**
 * @file transport.hpp
 * @brief 传输层抽象接口
 *
 * 会话层只通过该接口收发文本帧，生产环境使用 WebSocketTransport，
 * 测试中以脚本化的 MockTransport 替换。
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "core/endpoint.hpp"

namespace ironlink {

/**
 * @struct TransportOptions
 * @brief 传输层参数
 */
struct TransportOptions {
    std::chrono::milliseconds connect_timeout{10000};  ///< TCP 连接 + TLS + WebSocket 握手超时
    std::chrono::milliseconds idle_timeout{20000};     ///< 空闲超时：超时后发送 ping，再次超时则断开
    std::chrono::milliseconds close_timeout{2000};     ///< 等待关闭握手完成的时长
    size_t max_frame_size = 1 * 1024 * 1024;           ///< 单帧最大长度
    bool verify_peer = true;                           ///< wss 时校验服务端证书
    std::string user_agent = "ironlink/1.0";
};

/// 收到一个完整文本帧
using MessageHandler = std::function<void(const std::string& frame)>;

/// 连接被动断开（对端关闭或网络错误），参数为原因
using CloseHandler = std::function<void(const std::string& reason)>;

/**
 * @class Transport
 * @brief 单条物理连接
 *
 * 每个实例只用于一次连接：open 失败或连接断开后即废弃，
 * 重连时由 TransportFactory 创建新实例。
 *
 * @par 回调约定
 * - MessageHandler 在读循环线程中按到达顺序调用
 * - CloseHandler 只在连接被动断开时调用，且至多一次；本地 close() 不触发
 * - 回调中不得调用 close()，也不得销毁 Transport 实例
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief 建立连接并启动读循环
     * @param endpoint 券商地址
     * @param on_message 帧回调
     * @param on_close 被动断开回调
     * @return true 连接已建立
     * @return false 连接失败（原因已记录日志）
     */
    virtual bool open(const Endpoint& endpoint, MessageHandler on_message, CloseHandler on_close) = 0;

    /**
     * @brief 发送一个文本帧
     * @return true 已交给连接发送
     * @return false 连接未建立或已断开
     */
    virtual bool send(const std::string& frame) = 0;

    /**
     * @brief 关闭连接
     *
     * 幂等，任何状态下调用都安全。返回后读循环已停止。
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

/// 每次连接尝试创建一个新的传输实例
using TransportFactory = std::function<std::unique_ptr<Transport>()>;

} // namespace ironlink
