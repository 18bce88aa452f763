#pragma once

#include <memory>
#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace xlsxextract {

/**
 * @brief 进程级日志器
 *
 * 控制台输出走 stderr（stdout 留给命令行工具打印执行历史），
 * 可选同时写入日志文件，文件超过上限时按序号轮转。
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

    /**
     * @brief 初始化日志器
     * @param log_file_path 日志文件路径，为空时只输出到控制台
     */
    void initialize(const std::string& log_file_path = "",
                    Level level = Level::WARN,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    void setConsoleEnabled(bool enabled) { enable_console_.store(enabled); }

    void log(Level level, const std::string& message);

    template<typename... Args>
    void logf(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) {
            return;
        }
        try {
            log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
        } catch (const fmt::format_error& e) {
            log(level, fmt_str + " [format error: " + e.what() + "]");
        }
    }

    // 带源码位置信息的便捷接口（在宏中使用）
    template<typename... Args>
    void logCtx(Level level, const char* file, int line, const char* func,
                const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) {
            return;
        }
        const std::string fmt_with_ctx =
            fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        logf(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 提取文件名（去除路径）
    static const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::WARN};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define XLSXEXTRACT_FUNC __FUNCTION__
#else
#  define XLSXEXTRACT_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define XLSXEXTRACT_LOG_AT(lvl, fmt, ...) \
    xlsxextract::Logger::getInstance().logCtx(lvl, __FILE__, __LINE__, XLSXEXTRACT_FUNC, fmt, ##__VA_ARGS__)

#define XLSXEXTRACT_LOG_TRACE(fmt, ...)    XLSXEXTRACT_LOG_AT(xlsxextract::Logger::Level::TRACE, fmt, ##__VA_ARGS__)
#define XLSXEXTRACT_LOG_DEBUG(fmt, ...)    XLSXEXTRACT_LOG_AT(xlsxextract::Logger::Level::DEBUG, fmt, ##__VA_ARGS__)
#define XLSXEXTRACT_LOG_INFO(fmt, ...)     XLSXEXTRACT_LOG_AT(xlsxextract::Logger::Level::INFO, fmt, ##__VA_ARGS__)
#define XLSXEXTRACT_LOG_WARN(fmt, ...)     XLSXEXTRACT_LOG_AT(xlsxextract::Logger::Level::WARN, fmt, ##__VA_ARGS__)
#define XLSXEXTRACT_LOG_ERROR(fmt, ...)    XLSXEXTRACT_LOG_AT(xlsxextract::Logger::Level::ERROR, fmt, ##__VA_ARGS__)
#define XLSXEXTRACT_LOG_CRITICAL(fmt, ...) XLSXEXTRACT_LOG_AT(xlsxextract::Logger::Level::CRITICAL, fmt, ##__VA_ARGS__)

} // namespace xlsxextract
