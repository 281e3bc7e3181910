#include "Logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <system_error>
#include <thread>
#include <fmt/chrono.h>

namespace rowdoc {

namespace {

const char* consoleColor(Logger::Level level) {
    switch (level) {
        case Logger::Level::TRACE:    return "\033[90m";
        case Logger::Level::DEBUG:    return "\033[36m";
        case Logger::Level::INFO:     return "\033[32m";
        case Logger::Level::WARN:     return "\033[33m";
        case Logger::Level::ERROR:    return "\033[31m";
        case Logger::Level::CRITICAL: return "\033[1;31m";
        default:                      return "\033[0m";
    }
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_file_path,
                        Level level,
                        bool enable_console,
                        size_t max_file_size,
                        size_t max_files) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_.load() || shutting_down_.load()) {
            return;
        }

        current_level_.store(level);
        console_ = enable_console;
        file_path_ = log_file_path;
        max_file_size_ = std::max<size_t>(max_file_size, 1024);
        max_files_ = std::max<size_t>(max_files, 1);

        try {
            openFile();
        } catch (const std::filesystem::filesystem_error& ex) {
            // 文件不可用时只保留控制台输出
            std::cerr << "rowdoc logger: cannot open " << file_path_ << ": " << ex.what() << std::endl;
            file_path_.clear();
        }
        initialized_.store(true);
    }

    write(Level::DEBUG, fmt::format("logger ready, file='{}', level={}", file_path_, levelName(level)));
}

void Logger::setObserver(Observer observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

Logger::Level Logger::parseLevel(const std::string& name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    static const std::pair<const char*, Level> kNames[] = {
        {"TRACE", Level::TRACE},   {"DEBUG", Level::DEBUG},
        {"INFO", Level::INFO},     {"WARN", Level::WARN},
        {"WARNING", Level::WARN},  {"ERROR", Level::ERROR},
        {"CRITICAL", Level::CRITICAL}, {"OFF", Level::OFF},
    };
    for (const auto& entry : kNames) {
        if (key == entry.first) return entry.second;
    }
    return Level::INFO;
}

const char* Logger::levelName(Level level) {
    switch (level) {
        case Level::TRACE:    return "TRACE";
        case Level::DEBUG:    return "DEBUG";
        case Level::INFO:     return "INFO";
        case Level::WARN:     return "WARN";
        case Level::ERROR:    return "ERROR";
        case Level::CRITICAL: return "CRITICAL";
        case Level::OFF:      return "OFF";
    }
    return "UNKNOWN";
}

bool Logger::shouldLog(Level level) const {
    if (level == Level::OFF || shutting_down_.load()) {
        return false;
    }
    return static_cast<int>(level) >= static_cast<int>(current_level_.load());
}

void Logger::write(Level level, const std::string& message) {
    if (!shouldLog(level)) return;
    if (!initialized_.load()) {
        initialize();
    }

    Observer observer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_.load()) return;

        const std::string line = decorate(level, message);
        if (console_) {
            std::cerr << consoleColor(level) << line << "\033[0m\n";
        }
        if (file_.is_open()) {
            rotateIfNeeded();
            file_ << line << '\n';
            file_size_ += line.size() + 1;
        }
        if (level >= Level::WARN) {
            if (file_.is_open()) file_.flush();
            std::cerr.flush();
        }
        observer = observer_;
    }

    // 观察者在锁外回调，允许其内部再写日志
    if (observer) {
        observer(level, message);
    }
}

void Logger::openFile() {
    if (file_path_.empty()) {
        return;
    }
    const std::filesystem::path path(file_path_);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    file_.open(file_path_, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        throw std::filesystem::filesystem_error("open failed", path,
                                                std::make_error_code(std::errc::permission_denied));
    }
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    file_size_ = ec ? 0 : static_cast<size_t>(size);
}

void Logger::rotateIfNeeded() {
    if (file_size_ < max_file_size_) {
        return;
    }
    file_.close();

    std::error_code ec;
    // 最旧的文件被覆盖，其余依次后移
    for (size_t index = max_files_ - 1; index > 0; --index) {
        const std::string from = rotatedName(index - 1);
        if (std::filesystem::exists(from, ec)) {
            std::filesystem::rename(from, rotatedName(index), ec);
        }
    }
    if (max_files_ == 1) {
        std::filesystem::remove(file_path_, ec);
    }

    file_.open(file_path_, std::ios::out | std::ios::trunc);
    file_size_ = 0;
}

std::string Logger::rotatedName(size_t index) const {
    return index == 0 ? file_path_ : fmt::format("{}.{}", file_path_, index);
}

std::string Logger::decorate(Level level, const std::string& message) const {
    const auto now = std::chrono::system_clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    std::ostringstream tid;
    tid << std::this_thread::get_id();
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d} {:<8} (t{}) {}",
                       local, static_cast<int>(millis), levelName(level), tid.str(), message);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
    std::cerr.flush();
}

void Logger::shutdown() {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return;
    }
    shutting_down_.store(true);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
    file_size_ = 0;
    initialized_.store(false);
    // 允许之后重新 initialize
    shutting_down_.store(false);
}

Logger::~Logger() {
    shutdown();
}

} // namespace rowdoc
