/**
 * @file websocket_transport.hpp
 * @brief 基于 Boost.Beast 的 WebSocket 传输实现
 *
 * 支持 ws:// 与 wss://（TLS + SNI + 证书校验），协议层 ping 保活。
 */

#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>

#include "core/transport.hpp"

namespace ironlink {

/**
 * @class WebSocketTransport
 * @brief 一条 WebSocket 连接
 *
 * @par 线程模型
 * - open() 在调用线程上同步完成 DNS 解析、TCP 连接、TLS 握手与 WebSocket 握手，
 *   每一步都受 connect_timeout 约束
 * - 握手成功后启动独立的 I/O 线程运行 io_context，读循环和写队列都在该线程中执行
 * - send() 可在任意线程调用，帧被投递到 I/O 线程的写队列，同一时刻只有一个写操作
 *
 * @par 数据流
 * @code
 * 接收: socket -> async_read -> MessageHandler
 * 发送: send() -> post -> write_queue_ -> async_write -> socket
 * @endcode
 *
 * @par 断开
 * 读或写出错时连接标记为断开并调用一次 CloseHandler；
 * 本地 close() 发送关闭帧，最多等待 close_timeout 后强制关闭 socket。
 */
class WebSocketTransport : public Transport {
public:
    explicit WebSocketTransport(TransportOptions options = TransportOptions());

    /**
     * @brief 析构时关闭连接并等待 I/O 线程退出
     */
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    bool open(const Endpoint& endpoint, MessageHandler on_message, CloseHandler on_close) override;
    bool send(const std::string& frame) override;
    void close() override;
    bool is_open() const override { return open_.load(); }

private:
    using PlainStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;
    using TlsStream = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

    /// 对当前使用的流（明文或 TLS）执行操作
    template<class F>
    void with_stream(F&& f);

    /// 在调用线程上运行一步异步操作直至完成
    template<class Op>
    boost::beast::error_code run_step(Op&& op);

    bool handshake(const Endpoint& endpoint);
    void do_read();
    void on_read(boost::beast::error_code ec);
    void do_write();
    void on_failure(const std::string& reason);

    TransportOptions options_;
    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_;
    std::unique_ptr<PlainStream> plain_ws_;
    std::unique_ptr<TlsStream> tls_ws_;
    boost::beast::flat_buffer read_buffer_;
    std::deque<std::string> write_queue_;   ///< 仅在 I/O 线程中访问
    std::unique_ptr<boost::asio::steady_timer> close_timer_;

    MessageHandler on_message_;
    CloseHandler on_close_;

    std::atomic<bool> opened_{false};       ///< open() 已被调用过
    std::atomic<bool> open_{false};         ///< 连接可用
    std::atomic<bool> closing_{false};      ///< 本地已发起关闭
    std::atomic<bool> close_notified_{false};
    std::thread io_thread_;
};

} // namespace ironlink
