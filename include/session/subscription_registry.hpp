/**
 * @file subscription_registry.hpp
 * @brief 行情订阅登记表
 */

#pragma once

#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace ironlink {

/**
 * @class SubscriptionRegistry
 * @brief 当前有效的行情订阅集合
 *
 * 只在券商确认订阅/退订后更新。断线重连后，登记表是需要重新
 * 订阅的合约列表的唯一来源。同一合约只出现一次。线程安全。
 */
class SubscriptionRegistry {
public:
    SubscriptionRegistry() = default;
    SubscriptionRegistry(const SubscriptionRegistry&) = delete;
    SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

    /**
     * @brief 登记订阅
     * @return true 新增
     * @return false 已存在
     */
    bool add(const std::string& symbol);

    /**
     * @brief 移除订阅
     * @return true 移除成功
     * @return false 未订阅该合约
     */
    bool remove(const std::string& symbol);

    bool contains(const std::string& symbol) const;

    /**
     * @brief 当前订阅快照（按合约代码排序）
     */
    std::vector<std::string> current() const;

    size_t size() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::set<std::string> symbols_;
};

} // namespace ironlink
