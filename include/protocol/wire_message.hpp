/**
 * @file wire_message.hpp
 * @brief 券商报文封装与编解码器
 *
 * WireMessage 以字段名访问一条 JSON 报文，MessageCodec 负责
 * 报文与 WebSocket 文本帧之间的转换，并在出站时自动补充时间戳。
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "protocol/wire_fields.hpp"

namespace ironlink {

/**
 * @class DecodeError
 * @brief 入站帧无法解析为合法报文
 *
 * 读循环捕获该异常后记录日志并丢弃该帧，连接不受影响。
 */
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class WireMessage
 * @brief 券商报文的面向对象封装
 *
 * 封装一条 JSON 对象报文，提供按字段名的类型化访问接口。
 *
 * @par 使用示例
 * @code
 * WireMessage msg;
 * msg.set(fields::Action, actions::Subscribe);
 * msg.set(fields::Symbol, "MES");
 *
 * std::string action = msg.get_string(fields::Action);
 * bool has_id = msg.has(fields::RequestId);
 * @endcode
 */
class WireMessage {
public:
    WireMessage();

    /**
     * @brief 从已解析的 JSON 对象构造
     * @param body JSON 对象
     * @throws std::invalid_argument body 不是 JSON 对象时抛出
     */
    explicit WireMessage(nlohmann::json body);

    /// @name 字段写入
    /// @{
    void set(const std::string& field, const std::string& value);
    void set(const std::string& field, const char* value);
    void set(const std::string& field, int value);
    void set(const std::string& field, int64_t value);
    void set(const std::string& field, double value);
    void set(const std::string& field, bool value);
    void set_json(const std::string& field, nlohmann::json value);
    /// @}

    /**
     * @brief 获取字符串类型字段值
     * @param field 字段名
     * @return std::string 字段值；非字符串字段返回其 JSON 文本
     * @throws std::runtime_error 字段不存在时抛出异常
     */
    std::string get_string(const std::string& field) const;

    /**
     * @brief 获取字符串类型字段值，字段不存在时返回默认值
     */
    std::string get_string(const std::string& field, const std::string& default_value) const;

    /**
     * @brief 获取整数类型字段值
     * @throws std::runtime_error 字段不存在或不是数值时抛出异常
     */
    int64_t get_int(const std::string& field) const;

    /**
     * @brief 获取浮点类型字段值
     * @throws std::runtime_error 字段不存在或不是数值时抛出异常
     */
    double get_double(const std::string& field) const;

    /**
     * @brief 获取任意字段的 JSON 值
     * @throws std::runtime_error 字段不存在时抛出异常
     */
    const nlohmann::json& get_json(const std::string& field) const;

    /**
     * @brief 检查字段是否存在且不为 null
     */
    bool has(const std::string& field) const;

    /**
     * @brief 移除字段
     */
    void erase(const std::string& field);

    /**
     * @brief 获取业务载荷（"data" 字段），不存在时返回空对象
     */
    const nlohmann::json& data() const;

    /**
     * @brief 判断是否为券商拒绝/错误响应
     *
     * type 为 "error"，或 status 为 "error" / "rejected" 时视为拒绝。
     */
    bool is_rejection() const;

    /**
     * @brief 提取说明文字（message 字段，其次为 data.message）
     */
    std::string reason() const;

    /**
     * @brief 获取完整的 JSON 对象
     */
    const nlohmann::json& body() const { return body_; }

private:
    friend class MessageCodec;
    nlohmann::json body_; ///< 报文内容，始终为 JSON 对象
};


/**
 * @class MessageCodec
 * @brief 报文编解码器
 *
 * @par 编码流程
 * 1. 若报文未携带 timestamp，自动补充当前 UTC 时间
 * 2. 序列化为紧凑 JSON 文本
 *
 * @par 解码流程
 * 1. 拒绝超过最大长度的帧
 * 2. 解析 JSON，要求顶层为对象
 * 3. 要求至少带有 type 或 request_id 之一（否则无法路由）
 */
class MessageCodec {
public:
    /// 单帧最大长度（1 MB）
    static constexpr size_t kMaxFrameSize = 1 * 1024 * 1024;

    explicit MessageCodec(size_t max_frame_size = kMaxFrameSize)
        : max_frame_size_(max_frame_size) {}

    /**
     * @brief 将报文编码为文本帧
     * @param msg 要编码的报文（会被补充时间戳）
     * @return std::string JSON 文本
     */
    std::string encode(WireMessage& msg) const;

    /**
     * @brief 将文本帧解码为报文
     * @param raw 原始文本帧
     * @return WireMessage 解码后的报文
     * @throws DecodeError 帧过长、JSON 非法、不是对象或缺少路由字段时抛出
     */
    WireMessage decode(const std::string& raw) const;

    /**
     * @brief 生成 UTC 时间戳
     * @return std::string 格式：YYYY-MM-DDTHH:MM:SS.mmmZ
     */
    static std::string utc_timestamp();

private:
    size_t max_frame_size_; ///< 单帧最大长度
};

} // namespace ironlink
