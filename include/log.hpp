/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#pragma once

#include <stdint.h>

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

enum LogLevel : int32_t {
    LOG_LEVEL_TRACE = 0,
    LOG_LEVEL_DEBUG,
    LOG_LEVEL_INFO,
    LOG_LEVEL_WARN,
    LOG_LEVEL_ERROR
};

const char *log_level_name(LogLevel level);

class LogManager {
 public:
    void SetLogLevel(int32_t level) { level_.store(level); }
    int32_t GetLogLevel() const { return level_.load(); }
    bool IsEnabled(LogLevel level) const { return level >= level_.load(); }

    // nullptr restores stderr
    void SetOutput(std::ostream *out);

    void Write(LogLevel level, const char *tag, const std::string &message);

 private:
    std::atomic<int32_t> level_{LOG_LEVEL_INFO};
    std::mutex output_mtx_;
    std::ostream *out_ = nullptr;
};

extern LogManager g_log_manager;

/**
 * One log statement. The line is handed to g_log_manager when the temporary
 * is destroyed, at the end of the full expression.
 */
class LogStream {
 public:
    LogStream(LogLevel level, const char *tag)
        : level_(level), tag_(tag), enabled_(g_log_manager.IsEnabled(level)) {}
    LogStream(const LogStream &) = delete;
    LogStream &operator=(const LogStream &) = delete;
    ~LogStream() {
        if (enabled_) {
            g_log_manager.Write(level_, tag_, buffer_.str());
        }
    }

    template <typename T>
    LogStream &operator<<(const T &value) {
        if (enabled_) {
            buffer_ << value;
        }
        return *this;
    }

    // std::endl and friends
    LogStream &operator<<(std::ostream &(*manipulator)(std::ostream &)) {
        if (enabled_) {
            manipulator(buffer_);
        }
        return *this;
    }

 private:
    LogLevel level_;
    const char *tag_;
    bool enabled_;
    std::ostringstream buffer_;
};

#define LTRACE(tag) LogStream(LOG_LEVEL_TRACE, #tag)
#define LDEBUG(tag) LogStream(LOG_LEVEL_DEBUG, #tag)
#define LINFO(tag) LogStream(LOG_LEVEL_INFO, #tag)
#define LWARN(tag) LogStream(LOG_LEVEL_WARN, #tag)
#define LERROR(tag) LogStream(LOG_LEVEL_ERROR, #tag)
