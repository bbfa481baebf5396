/**
 * @file endpoint.hpp
 * @brief 券商 WebSocket 地址解析
 */

#pragma once

#include <cstdint>
#include <string>

namespace ironlink {

/**
 * @struct Endpoint
 * @brief 解析后的 WebSocket 地址
 */
struct Endpoint {
    std::string url;        ///< 原始地址
    std::string host;       ///< 主机名（用于 DNS 解析、Host 头和 TLS SNI）
    uint16_t port = 0;      ///< 端口
    std::string target;     ///< 请求路径，至少为 "/"
    bool tls = false;       ///< wss:// 时为 true

    /**
     * @brief Host 头内容（非默认端口时附带端口号）
     */
    std::string host_header() const;
};

/**
 * @brief 解析 ws:// 或 wss:// 地址
 * @param url 形如 "wss://demo.ironbeam.com/socket" 的地址
 * @return Endpoint 解析结果（ws 默认端口 80，wss 默认端口 443）
 * @throws std::invalid_argument 协议不支持、主机名为空或端口非法时抛出
 */
Endpoint parse_endpoint(const std::string& url);

} // namespace ironlink
