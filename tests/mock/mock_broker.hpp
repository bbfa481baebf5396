/**
 * @file mock_broker.hpp
 * @brief 脚本化的券商模拟与内存传输层
 *
 * MockBroker 代替真实券商：记录客户端发出的每个请求，按脚本应答
 * （确认、忽略或拒绝），可主动推送事件、模拟断线和连接失败。
 * MockTransport 是连接到 MockBroker 的 Transport 实现，用一个单线程
 * ThreadPool 模拟读循环线程，入站帧与断线通知都在该线程上按序投递。
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "base/thread_pool.hpp"
#include "core/transport.hpp"

namespace ironlink::mock {

class MockTransport;

/// 轮询等待条件成立
template<class Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

/**
 * @class MockBroker
 * @brief 券商模拟
 *
 * @par 使用示例
 * @code
 * auto broker = std::make_shared<MockBroker>();
 * broker->ignore_action("place_order");
 * BrokerClient client(options, broker->factory());
 * client.connect();
 * broker->push_event("market_data", {{"symbol", "MES"}, {"last", 5000.25}});
 * broker->drop_connection("network down");
 * @endcode
 */
class MockBroker : public std::enable_shared_from_this<MockBroker> {
public:
    MockBroker() = default;

    // ------------------------------------------------------------------
    // 脚本
    // ------------------------------------------------------------------

    /// 接下来 n 次 open() 失败
    void fail_next_opens(int n) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_opens_ = n;
    }

    /// 此后所有 open() 都失败（或恢复）
    void fail_all_opens(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_all_opens_ = fail;
    }

    /// 收到该动作的请求时不应答
    void ignore_action(const std::string& action) {
        std::lock_guard<std::mutex> lock(mutex_);
        ignored_.insert(action);
    }

    /// 收到该动作的请求时返回拒绝
    void reject_action(const std::string& action, const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        rejected_[action] = reason;
    }

    /// 拒绝对某个合约的订阅
    void reject_symbol(const std::string& symbol, const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        rejected_symbols_[symbol] = reason;
    }

    /// 接下来 n 次应答该动作后，在同一读循环任务中断开连接
    void close_after_reply(const std::string& action, int n = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        close_after_[action] = n;
    }

    /// 清除忽略与拒绝脚本
    void respond_normally() {
        std::lock_guard<std::mutex> lock(mutex_);
        ignored_.clear();
        rejected_.clear();
        rejected_symbols_.clear();
        close_after_.clear();
    }

    /// 设置某动作确认时附带的 data
    void set_response_data(const std::string& action, nlohmann::json data) {
        std::lock_guard<std::mutex> lock(mutex_);
        response_data_[action] = std::move(data);
    }

    // ------------------------------------------------------------------
    // 主动行为
    // ------------------------------------------------------------------

    /// 推送一条事件 {"type": type, "data": data}
    void push_event(const std::string& type, nlohmann::json data);

    /// 推送原始文本帧
    void push_raw(const std::string& frame);

    /// 模拟对端断开当前连接
    void drop_connection(const std::string& reason = "connection reset by peer");

    // ------------------------------------------------------------------
    // 观察
    // ------------------------------------------------------------------

    /// 客户端发出的全部请求
    std::vector<nlohmann::json> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    /// 某动作的请求数量
    size_t count_sent(const std::string& action) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_locked(action);
    }

    /// 某动作请求中的 symbol 字段
    std::vector<std::string> sent_symbols(const std::string& action) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> symbols;
        for (const auto& msg : sent_) {
            if (msg.value("action", "") == action) {
                symbols.push_back(msg.value("symbol", ""));
            }
        }
        return symbols;
    }

    /// 等待某动作的请求数量达到 n
    bool wait_for_sent(const std::string& action, size_t n, std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return count_locked(action) >= n; });
    }

    void clear_sent() {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.clear();
    }

    int open_attempts() const { return open_attempts_.load(); }
    int successful_opens() const { return successful_opens_.load(); }

    /// 连接认证确认之前收到的非认证请求数量
    int premature_requests() const { return premature_requests_.load(); }

    bool has_connection() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_ != nullptr;
    }

    /// 每次连接尝试创建一个连接到本券商的 MockTransport
    TransportFactory factory();

private:
    friend class MockTransport;

    bool accept_open();
    void attach(MockTransport* transport);
    void detach(MockTransport* transport);
    void on_client_frame(MockTransport* transport, const std::string& frame);

    size_t count_locked(const std::string& action) const {
        size_t n = 0;
        for (const auto& msg : sent_) {
            if (msg.value("action", "") == action) ++n;
        }
        return n;
    }

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    MockTransport* current_ = nullptr;
    int fail_opens_ = 0;
    bool fail_all_opens_ = false;
    std::set<std::string> ignored_;
    std::map<std::string, std::string> rejected_;
    std::map<std::string, std::string> rejected_symbols_;
    std::map<std::string, nlohmann::json> response_data_;
    std::map<std::string, int> close_after_;
    bool authenticated_ = false;   ///< 当前连接已确认认证
    std::atomic<int> premature_requests_{0};
    std::vector<nlohmann::json> sent_;
    std::atomic<int> open_attempts_{0};
    std::atomic<int> successful_opens_{0};
};

/**
 * @class MockTransport
 * @brief 连接到 MockBroker 的内存传输层
 */
class MockTransport : public Transport {
public:
    explicit MockTransport(std::shared_ptr<MockBroker> broker) : broker_(std::move(broker)) {}

    ~MockTransport() override { close(); }

    bool open(const Endpoint&, MessageHandler on_message, CloseHandler on_close) override {
        if (!broker_->accept_open()) {
            return false;
        }
        on_message_ = std::move(on_message);
        on_close_ = std::move(on_close);
        loop_ = std::make_unique<ThreadPool>(1);
        open_ = true;
        broker_->attach(this);
        return true;
    }

    bool send(const std::string& frame) override {
        if (!open_) {
            return false;
        }
        broker_->on_client_frame(this, frame);
        return true;
    }

    void close() override {
        open_ = false;
        broker_->detach(this);
        loop_.reset();  // 等待已排队的投递结束
    }

    bool is_open() const override { return open_.load(); }

    /// 在读循环线程上投递一个入站帧
    void deliver(const std::string& frame) {
        if (!loop_) return;
        loop_->enqueue_to(0, [this, frame] {
            if (open_) {
                on_message_(frame);
            }
        });
    }

    /// 在读循环线程的同一个任务中投递一帧并随即断开
    void deliver_and_fail(const std::string& frame, const std::string& reason) {
        if (!loop_) return;
        loop_->enqueue_to(0, [this, frame, reason] {
            if (open_) {
                on_message_(frame);
            }
            if (open_.exchange(false)) {
                on_close_(reason);
            }
        });
    }

    /// 在读循环线程上模拟被动断开
    void fail(const std::string& reason) {
        if (!loop_) return;
        loop_->enqueue_to(0, [this, reason] {
            if (open_.exchange(false)) {
                on_close_(reason);
            }
        });
    }

private:
    std::shared_ptr<MockBroker> broker_;
    MessageHandler on_message_;
    CloseHandler on_close_;
    std::atomic<bool> open_{false};
    std::unique_ptr<ThreadPool> loop_;
};

// --- MockBroker 实现 ---

inline TransportFactory MockBroker::factory() {
    std::shared_ptr<MockBroker> self = shared_from_this();
    return [self]() -> std::unique_ptr<Transport> {
        return std::make_unique<MockTransport>(self);
    };
}

inline bool MockBroker::accept_open() {
    ++open_attempts_;
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_all_opens_) {
        return false;
    }
    if (fail_opens_ > 0) {
        --fail_opens_;
        return false;
    }
    ++successful_opens_;
    return true;
}

inline void MockBroker::attach(MockTransport* transport) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = transport;
    authenticated_ = false;
}

inline void MockBroker::detach(MockTransport* transport) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_ == transport) {
        current_ = nullptr;
    }
}

inline void MockBroker::on_client_frame(MockTransport* transport, const std::string& frame) {
    nlohmann::json request = nlohmann::json::parse(frame);
    const std::string action = request.value("action", "");
    const std::string symbol = request.value("symbol", "");

    std::lock_guard<std::mutex> lock(mutex_);
    sent_.push_back(request);
    cv_.notify_all();

    if (action != "authenticate" && transport == current_ && !authenticated_) {
        ++premature_requests_;
    }

    if (ignored_.count(action) > 0) {
        return;
    }

    nlohmann::json response = {
        {"type", action + "_response"},
        {"request_id", request.value("request_id", "")},
    };

    std::string reason;
    auto rejected = rejected_.find(action);
    if (rejected != rejected_.end()) {
        reason = rejected->second;
    } else if (action == "subscribe") {
        auto symbol_rejected = rejected_symbols_.find(symbol);
        if (symbol_rejected != rejected_symbols_.end()) {
            reason = symbol_rejected->second;
        }
    }

    if (!reason.empty()) {
        response["status"] = "rejected";
        response["message"] = reason;
    } else {
        response["status"] = "ok";
        if (action == "authenticate" && transport == current_) {
            authenticated_ = true;
        }
        auto data = response_data_.find(action);
        if (data != response_data_.end()) {
            response["data"] = data->second;
        } else if (!symbol.empty()) {
            response["data"] = {{"symbol", symbol}};
        }
    }
    auto close_after = close_after_.find(action);
    if (close_after != close_after_.end() && close_after->second > 0) {
        --close_after->second;
        transport->deliver_and_fail(response.dump(), "closed by broker after " + action);
        return;
    }
    transport->deliver(response.dump());
}

inline void MockBroker::push_event(const std::string& type, nlohmann::json data) {
    nlohmann::json event = {{"type", type}, {"data", std::move(data)}};
    push_raw(event.dump());
}

inline void MockBroker::push_raw(const std::string& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_) {
        current_->deliver(frame);
    }
}

inline void MockBroker::drop_connection(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_) {
        current_->fail(reason);
    }
}

} // namespace ironlink::mock
