/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#include "log.hpp"

#include <sys/time.h>
#include <time.h>
#include <stdio.h>

LogManager g_log_manager;

const char *log_level_name(LogLevel level) {
    switch (level) {
        case LOG_LEVEL_TRACE:
            return "TRACE";
        case LOG_LEVEL_DEBUG:
            return "DEBUG";
        case LOG_LEVEL_INFO:
            return "INFO";
        case LOG_LEVEL_WARN:
            return "WARN";
        case LOG_LEVEL_ERROR:
            return "ERROR";
    }
    return "UNKNOWN";
}

void LogManager::SetOutput(std::ostream *out) {
    std::lock_guard<std::mutex> lock(output_mtx_);
    out_ = out;
}

void LogManager::Write(LogLevel level, const char *tag, const std::string &message) {
    std::string line = message;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }

    struct timeval time_now {};
    gettimeofday(&time_now, nullptr);
    struct tm local_time {};
    localtime_r(&time_now.tv_sec, &local_time);
    char time_buff[32];
    snprintf(time_buff, sizeof(time_buff), "%02d:%02d:%02d.%03ld", local_time.tm_hour, local_time.tm_min,
             local_time.tm_sec, static_cast<long>(time_now.tv_usec / 1000));

    std::lock_guard<std::mutex> lock(output_mtx_);
    std::ostream &out = out_ != nullptr ? *out_ : std::cerr;
    out << "[" << time_buff << "] [" << log_level_name(level) << "] [" << tag << "] " << line << std::endl;
}
