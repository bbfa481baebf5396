/**
 * @file request_id.hpp
 * @brief 请求关联 ID 生成器
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace ironlink {

/**
 * @class RequestIdGenerator
 * @brief 生成形如 "req_<epoch_ms>_<seq>" 的关联 ID
 *
 * epoch_ms 取自生成器构造时刻（本次运行的会话纪元），用于跨进程重启去重；
 * seq 为原子递增序号，保证同一进程内不重复。线程安全。
 */
class RequestIdGenerator {
public:
    /**
     * @brief 以当前时间作为会话纪元构造
     */
    RequestIdGenerator();

    /**
     * @brief 以指定纪元构造（测试用）
     * @param epoch_ms 会话纪元（毫秒）
     */
    explicit RequestIdGenerator(int64_t epoch_ms) : epoch_ms_(epoch_ms) {}

    /**
     * @brief 生成下一个关联 ID
     */
    std::string next();

    /**
     * @brief 已生成的 ID 数量
     */
    uint64_t issued() const { return sequence_.load(std::memory_order_relaxed); }

    int64_t epoch_ms() const { return epoch_ms_; }

private:
    const int64_t epoch_ms_;              ///< 会话纪元
    std::atomic<uint64_t> sequence_{0};   ///< 递增序号
};

} // namespace ironlink
