#pragma once

#include <atomic>
#include <cstring>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace rowdoc {

/**
 * @brief 进程级日志器
 *
 * 控制台(stderr) + 按大小轮转的文件输出，格式化统一走 fmt。
 * 未调用 initialize 时，第一次写日志会按默认参数自动初始化。
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

    /**
     * @brief 日志观察者，收到每条已通过级别过滤的消息（不含时间戳等前缀）
     */
    using Observer = std::function<void(Level, const std::string&)>;

    static Logger& getInstance();

    /**
     * @param log_file_path 日志文件，空字符串表示不写文件
     * @param max_file_size 单个文件上限，超过后轮转为 .1 .2 ...
     * @param max_files 保留的文件个数（含当前文件）
     */
    void initialize(const std::string& log_file_path = "logs/rowdoc.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5);

    void setLevel(Level level) { current_level_.store(level); }
    Level getLevel() const { return current_level_.load(); }

    void setObserver(Observer observer);

    /**
     * @brief 解析级别名称，不区分大小写
     * @return 无法识别时返回 INFO
     */
    static Level parseLevel(const std::string& name);
    static const char* levelName(Level level);

    template<typename... Args>
    void log(Level level, const std::string& fmt_str, Args&&... args) {
        if (!shouldLog(level)) return;
        std::string message;
        try {
            message = fmt::vformat(fmt_str, fmt::make_format_args(args...));
        } catch (const fmt::format_error&) {
            // 格式串与参数不匹配时退化为原样输出
            message = fmt_str;
        }
        write(level, message);
    }

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    void logCtx(Level level, const char* file, int line, const char* func,
                const std::string& fmt_str, Args&&... args) {
        if (!shouldLog(level)) return;
        log(level, fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str),
            std::forward<Args>(args)...);
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool shouldLog(Level level) const;
    void write(Level level, const std::string& message);
    void openFile();
    void rotateIfNeeded();
    std::string rotatedName(size_t index) const;
    std::string decorate(Level level, const std::string& message) const;

    static const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash = std::strrchr(path, '/');
        const char* backslash = std::strrchr(path, '\\');
        const char* p = slash > backslash ? slash : backslash;
        return p ? p + 1 : path;
    }

    std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> shutting_down_{false};
    bool console_ = true;

    std::string file_path_;
    std::ofstream file_;
    size_t file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;

    Observer observer_;
};

} // namespace rowdoc

// 统一日志宏（带源码位置信息）
#define ROWDOC_LOG_TRACE(fmt, ...)    rowdoc::Logger::getInstance().logCtx(rowdoc::Logger::Level::TRACE,    __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)
#define ROWDOC_LOG_DEBUG(fmt, ...)    rowdoc::Logger::getInstance().logCtx(rowdoc::Logger::Level::DEBUG,    __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)
#define ROWDOC_LOG_INFO(fmt, ...)     rowdoc::Logger::getInstance().logCtx(rowdoc::Logger::Level::INFO,     __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)
#define ROWDOC_LOG_WARN(fmt, ...)     rowdoc::Logger::getInstance().logCtx(rowdoc::Logger::Level::WARN,     __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)
#define ROWDOC_LOG_ERROR(fmt, ...)    rowdoc::Logger::getInstance().logCtx(rowdoc::Logger::Level::ERROR,    __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)
#define ROWDOC_LOG_CRITICAL(fmt, ...) rowdoc::Logger::getInstance().logCtx(rowdoc::Logger::Level::CRITICAL, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)
