#pragma once

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>
#include <fmt/chrono.h>

#ifdef ERROR
#undef ERROR
#endif

namespace epubkit {

/**
 * @brief 进程级日志器
 *
 * 基于fmt格式化，支持控制台彩色输出和按大小轮转的日志文件。
 * 未显式初始化时，第一次写日志会使用默认参数自动初始化。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    void initialize(const std::string& log_file_path = "logs/epubkit.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    bool isInitialized() const { return initialized_.load(); }

    void trace(const std::string& message)    { write(Level::TRACE, message); }
    void debug(const std::string& message)    { write(Level::DEBUG, message); }
    void info(const std::string& message)     { write(Level::INFO, message); }
    void warn(const std::string& message)     { write(Level::WARN, message); }
    void error(const std::string& message)    { write(Level::ERROR, message); }
    void critical(const std::string& message) { write(Level::CRITICAL, message); }

    /**
     * @brief 格式化后写入日志
     *
     * 格式串与参数不匹配时退化为输出原始格式串，不向调用方抛出。
     */
    template<typename... Args>
    inline void log(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        try {
            write(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
        } catch (const fmt::format_error&) {
            write(level, fmt_str);
        }
    }

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx = fmt::format("[{}:{}:{}] {}",
            baseFilename(file), line, extractFunctionName(func), fmt_str);
        log(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    void flush();

    /**
     * @brief 关闭日志文件
     *
     * 关闭后可以再次调用initialize()重新打开（测试夹具依赖这一点）。
     */
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(Level level, const std::string& message);
    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 提取文件名（去除路径）
    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    // 提取函数名（去除命名空间和参数）
    static inline std::string extractFunctionName(const char* func_sig) {
        if (!func_sig) return "";
        std::string sig(func_sig);
        size_t last_colon = sig.rfind("::");
        if (last_colon != std::string::npos) {
            sig = sig.substr(last_colon + 2);
        }
        size_t paren = sig.find('(');
        if (paren != std::string::npos) {
            sig = sig.substr(0, paren);
        }
        return sig;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    std::atomic<size_t> current_file_size_{0};
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

// 跨编译器的函数名宏
#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define EPUBKIT_FUNC __FUNCTION__
#else
#  define EPUBKIT_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define EPUBKIT_LOG_TRACE(fmt, ...)    epubkit::Logger::getInstance().logCtx(epubkit::Logger::Level::TRACE,    __FILE__, __LINE__, EPUBKIT_FUNC, fmt, ##__VA_ARGS__)
#define EPUBKIT_LOG_DEBUG(fmt, ...)    epubkit::Logger::getInstance().logCtx(epubkit::Logger::Level::DEBUG,    __FILE__, __LINE__, EPUBKIT_FUNC, fmt, ##__VA_ARGS__)
#define EPUBKIT_LOG_INFO(fmt, ...)     epubkit::Logger::getInstance().logCtx(epubkit::Logger::Level::INFO,     __FILE__, __LINE__, EPUBKIT_FUNC, fmt, ##__VA_ARGS__)
#define EPUBKIT_LOG_WARN(fmt, ...)     epubkit::Logger::getInstance().logCtx(epubkit::Logger::Level::WARN,     __FILE__, __LINE__, EPUBKIT_FUNC, fmt, ##__VA_ARGS__)
#define EPUBKIT_LOG_ERROR(fmt, ...)    epubkit::Logger::getInstance().logCtx(epubkit::Logger::Level::ERROR,    __FILE__, __LINE__, EPUBKIT_FUNC, fmt, ##__VA_ARGS__)
#define EPUBKIT_LOG_CRITICAL(fmt, ...) epubkit::Logger::getInstance().logCtx(epubkit::Logger::Level::CRITICAL, __FILE__, __LINE__, EPUBKIT_FUNC, fmt, ##__VA_ARGS__)

} // namespace epubkit
