/**
 * @file logger.hpp
 * @brief 线程安全的分级日志输出工具
 *
 * 提供简洁的流式日志接口，确保多线程环境下日志输出的完整性。
 * 读循环线程、生命周期线程和调用方线程共用同一个输出通道。
 */

#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>
#include <unistd.h>

namespace ironlink {

/**
 * @enum LogLevel
 * @brief 日志级别
 */
enum class LogLevel : int {
    DEBUG = 0,  ///< 调试信息（迟到响应、未处理的消息类型等）
    INFO = 1,   ///< 常规运行信息（状态转换、订阅变化）
    WARN = 2,   ///< 可恢复的异常情况（连接丢失、解码失败）
    ERROR = 3   ///< 需要关注的错误（认证失败、重连次数耗尽）
};

/**
 * @brief 获取日志级别对应的标签
 * @param level 日志级别
 * @return const char* 形如 "[WARN]" 的标签
 */
inline const char* log_level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "[DEBUG]";
        case LogLevel::INFO:  return "[INFO]";
        case LogLevel::WARN:  return "[WARN]";
        case LogLevel::ERROR: return "[ERROR]";
    }
    return "[INFO]";
}

/**
 * @class Logger
 * @brief 线程安全的日志输出器（单例模式）
 *
 * 确保每条日志完整输出，不会被其他线程的输出打断。
 * 使用 POSIX write() 系统调用保证原子性写入。
 *
 * @par 使用示例
 * @code
 * LOG() << "[Lifecycle] Session ready";
 * LOG_WARN() << "[Lifecycle] Connection lost: " << reason;
 * @endcode
 *
 * @note 日志会自动在末尾添加换行符
 */
class Logger {
public:
    /**
     * @brief 获取 Logger 单例实例
     * @return Logger& 单例引用
     */
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * @class LogStream
     * @brief 日志流对象，支持流式输出
     *
     * 该对象在析构时将缓冲区内容原子性地写入标准输出。
     * 被级别过滤掉的日志流不产生任何输出。
     */
    class LogStream {
    public:
        /**
         * @brief 构造日志流
         * @param mtx 用于保护输出的互斥锁引用
         * @param active 是否真正输出
         * @param level 本条日志的级别
         */
        LogStream(std::mutex& mtx, bool active, LogLevel level)
            : mtx_(mtx), active_(active) {
            if (active_) {
                buffer_ << log_level_tag(level) << ' ';
            }
        }

        /**
         * @brief 析构时输出日志
         *
         * 自动添加换行符，并使用 write() 系统调用原子性写入。
         */
        ~LogStream() {
            if (!active_) return;
            buffer_ << '\n';
            std::string str = buffer_.str();
            std::lock_guard<std::mutex> lock(mtx_);
            // 使用 write() 系统调用，单次调用是原子的
            ssize_t written = ::write(STDOUT_FILENO, str.c_str(), str.size());
            (void)written;
        }

        LogStream(const LogStream&) = delete;
        LogStream& operator=(const LogStream&) = delete;

        /**
         * @brief 移动构造函数
         * @param other 源对象（移动后不再输出）
         */
        LogStream(LogStream&& other) noexcept
            : mtx_(other.mtx_), active_(other.active_), buffer_(std::move(other.buffer_)) {
            other.active_ = false;
        }

        /**
         * @brief 流式输出操作符
         * @tparam T 值类型（需支持 ostream 输出）
         * @param value 要输出的值
         * @return LogStream& 返回自身以支持链式调用
         */
        template<typename T>
        LogStream& operator<<(const T& value) {
            if (active_) {
                buffer_ << value;
            }
            return *this;
        }

    private:
        std::mutex& mtx_;           ///< 互斥锁引用
        bool active_;               ///< 是否输出
        std::ostringstream buffer_; ///< 日志缓冲区
    };

    /**
     * @brief 创建日志流对象
     * @param level 日志级别，低于最小级别的日志被丢弃
     * @return LogStream 日志流对象
     */
    LogStream log(LogLevel level = LogLevel::INFO) {
        const bool active = enabled_.load(std::memory_order_relaxed) &&
            static_cast<int>(level) >= static_cast<int>(min_level_.load(std::memory_order_relaxed));
        return LogStream(mutex_, active, level);
    }

    /**
     * @brief 设置最小输出级别
     * @param level 最小级别
     */
    void set_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }

    /**
     * @brief 获取最小输出级别
     */
    LogLevel level() const { return min_level_.load(std::memory_order_relaxed); }

    /**
     * @brief 启用或关闭全部日志输出
     * @param enabled false 时所有日志被丢弃（例如交互式控制台输入期间）
     */
    void set_enabled(bool enabled) { enabled_.store(enabled, std::memory_order_relaxed); }

private:
    Logger() = default;
    std::mutex mutex_;                              ///< 保护日志输出的互斥锁
    std::atomic<bool> enabled_{true};               ///< 输出开关
    std::atomic<LogLevel> min_level_{LogLevel::INFO}; ///< 最小输出级别
};

/**
 * @def LOG()
 * @brief INFO 级别日志输出宏
 *
 * 使用方式：LOG() << "message" << value;
 */
#define LOG() ironlink::Logger::instance().log()
#define LOG_DEBUG() ironlink::Logger::instance().log(ironlink::LogLevel::DEBUG)
#define LOG_WARN() ironlink::Logger::instance().log(ironlink::LogLevel::WARN)
#define LOG_ERROR() ironlink::Logger::instance().log(ironlink::LogLevel::ERROR)

} // namespace ironlink
