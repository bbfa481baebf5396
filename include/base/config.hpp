/**
 * @file config.hpp
 * @brief 客户端 INI 配置
 *
 * 进程级单例，保存 [broker]、[reconnect]、[client] 等节的原始文本值，
 * 并提供整数、时长、布尔与合约列表的类型化读取。
 */

#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ironlink {

/**
 * @class Config
 * @brief INI 配置（单例，线程安全）
 *
 * 文件格式：
 * - [section] 开始一个配置节，之前的键属于空节 ""
 * - key = value，键与值两端空白会被去掉，值中可以再出现 '='
 * - 以 ; 或 # 开头的行是注释，不支持行尾注释（密钥中可能含有这两个字符）
 *
 * 读取失败（缺失或格式错误）一律返回调用方给出的默认值，格式错误会记一条 WARN。
 *
 * @par 使用示例
 * @code
 * Config& config = Config::instance();
 * config.load("ironlink.ini");
 * auto delay = config.get_duration("reconnect", "base_delay_ms", std::chrono::seconds(5));
 * for (const auto& symbol : config.get_list("client", "symbols")) { ... }
 * @endcode
 */
class Config {
public:
    static Config& instance();

    /**
     * @brief 从文件加载配置，替换此前的全部内容
     * @return false 文件无法打开（此时配置为空）
     */
    bool load(const std::string& filename);

    void clear();

    /// 配置项是否存在（值可以为空）
    bool has(const std::string& section, const std::string& key);

    std::string get(const std::string& section, const std::string& key, const std::string& default_value = "");

    /**
     * @brief 读取整数
     *
     * 整个值必须是一个十进制整数，"12abc" 视为格式错误。
     */
    int get_int(const std::string& section, const std::string& key, int default_value = 0);

    double get_double(const std::string& section, const std::string& key, double default_value = 0.0);

    /**
     * @brief 读取布尔值
     *
     * 识别 true/false、yes/no、on/off、1/0（不区分大小写），其他值返回默认值。
     */
    bool get_bool(const std::string& section, const std::string& key, bool default_value = false);

    /**
     * @brief 读取时长
     * @return 不带单位的数字按毫秒解释；也接受 ms、s、m 后缀，如 "250ms"、"5s"、"1m"
     *
     * 负数视为格式错误。
     */
    std::chrono::milliseconds get_duration(const std::string& section, const std::string& key,
                                           std::chrono::milliseconds default_value);

    /**
     * @brief 读取逗号分隔的列表，如 "MES, MNQ ,ZN"
     *
     * 每项去掉两端空白，空项被丢弃。配置项不存在时解析 default_value。
     */
    std::vector<std::string> get_list(const std::string& section, const std::string& key,
                                      const std::string& default_value = "");

private:
    Config() = default;
    ~Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /// 查找原始值，调用方须持有 mutex_
    const std::string* find(const std::string& section, const std::string& key) const;

    /// section -> (key -> value)
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>> data_;
    std::mutex mutex_;
};

} // namespace ironlink
