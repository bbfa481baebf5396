/**
 * @file correlation_table.hpp
 * @brief 请求关联表
 *
 * 把在途请求的关联 ID 映射到一个只写一次的结果槽。
 * 响应、超时、断线三种结局互斥，先到者生效，之后的尝试均为空操作。
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "session/session_types.hpp"

namespace ironlink {

/**
 * @class PendingRequest
 * @brief 在途请求的结果槽
 *
 * 由 CorrelationTable 创建并持有，调用方只通过 ResultHandle 等待。
 * 所有字段都受所属 CorrelationTable 的互斥锁保护。
 */
class PendingRequest {
public:
    using Clock = std::chrono::steady_clock;

    PendingRequest(std::string id, Clock::time_point deadline)
        : id_(std::move(id)), deadline_(deadline) {}

    const std::string& id() const { return id_; }
    Clock::time_point deadline() const { return deadline_; }

private:
    friend class CorrelationTable;

    const std::string id_;             ///< 关联 ID
    const Clock::time_point deadline_; ///< 截止时间（从注册时刻起算）
    bool done_ = false;                ///< 结果是否已写入
    RequestOutcome outcome_;           ///< 最终结果
    std::condition_variable cv_;       ///< 等待结果的条件变量
};

/// 调用方持有的结果句柄
using ResultHandle = std::shared_ptr<PendingRequest>;

/**
 * @class CorrelationTable
 * @brief 关联 ID -> 在途请求 的线程安全映射
 *
 * @par 保证
 * - 同一时刻一个关联 ID 至多对应一个在途请求
 * - resolve / fail / 超时 对同一请求只生效一次
 * - 超时后条目立即移除，迟到的响应不会再命中
 *
 * @par 使用示例
 * @code
 * auto handle = table.register_request(id, std::chrono::seconds(10));
 * transport.send(frame);
 * RequestOutcome outcome = table.await(handle);   // 最迟在截止时间返回
 *
 * // 读循环中
 * table.resolve(id, response);
 * @endcode
 */
class CorrelationTable {
public:
    using Clock = PendingRequest::Clock;

    CorrelationTable() = default;
    CorrelationTable(const CorrelationTable&) = delete;
    CorrelationTable& operator=(const CorrelationTable&) = delete;

    /**
     * @brief 注册在途请求
     * @param id 关联 ID
     * @param timeout 超时时长，截止时间 = 当前时刻 + timeout
     * @return ResultHandle 结果句柄；id 已有在途请求时返回 nullptr
     */
    ResultHandle register_request(const std::string& id, Clock::duration timeout);

    /**
     * @brief 以券商响应完成请求
     * @param id 关联 ID
     * @param response 响应报文
     * @return true 命中在途请求并写入结果
     * @return false 请求不存在（已超时、已失败或从未注册），调用方按迟到响应处理
     */
    bool resolve(const std::string& id, WireMessage response);

    /**
     * @brief 以失败原因完成请求
     * @return true 命中在途请求并写入结果
     */
    bool fail(const std::string& id, RequestStatus status, const std::string& reason);

    /**
     * @brief 以同一失败原因完成所有在途请求（断线、关闭时调用）
     * @return size_t 被完成的请求数量
     */
    size_t fail_all(RequestStatus status, const std::string& reason);

    /**
     * @brief 等待请求结果
     * @param handle 结果句柄
     * @return RequestOutcome 响应结果；截止时间到达仍未完成时返回 TIMEOUT 并移除条目
     */
    RequestOutcome await(const ResultHandle& handle);

    /**
     * @brief 当前在途请求数量
     */
    size_t size() const;

    /**
     * @brief 检查关联 ID 是否在途
     */
    bool contains(const std::string& id) const;

    /**
     * @brief 当前所有在途请求的关联 ID（按字典序）
     */
    std::vector<std::string> pending_ids() const;

private:
    /**
     * @brief 写入结果并唤醒等待者（调用方必须持有 mutex_）
     * @return true 首次写入
     */
    static bool complete_locked(PendingRequest& slot, RequestOutcome outcome);

    mutable std::mutex mutex_;  ///< 保护 pending_ 以及所有结果槽
    std::unordered_map<std::string, ResultHandle> pending_; ///< 在途请求
};

} // namespace ironlink
