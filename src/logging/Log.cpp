#include "logging/Log.h"

#include "common/BoundedQueue.hpp"
#include "common/TimeUtils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <string>
#include <thread>
#include <utility>

namespace {
using logging::Log;

constexpr std::size_t kMessageBufferSize = 1024;
constexpr std::size_t kQueueCapacity = 4096;
constexpr std::chrono::seconds kFlushWait{2};

struct Line {
    config::LogLevel level{};
    std::string text;
};

void emit(const Line& line) {
    FILE* stream = (line.level == config::LogLevel::Error || line.level == config::LogLevel::Warn) ? stderr : stdout;
    std::fwrite(line.text.data(), 1, line.text.size(), stream);
    std::fputc('\n', stream);
    std::fflush(stream);
}

// One writer thread drains the queue; producers never touch the streams unless it is full.
class Sink {
public:
    Sink() : queue_(kQueueCapacity), writer_([this] { drain_(); }) {}

    ~Sink() {
        queue_.close();
        if (writer_.joinable()) {
            writer_.join();
        }
    }

    bool offer(Line line) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++pending_;
        }
        if (queue_.tryPush(std::move(line))) {
            return true;
        }
        done_();
        return false;
    }

    void waitDrained() {
        std::unique_lock<std::mutex> lock(mutex_);
        drained_.wait_for(lock, kFlushWait, [&] { return pending_ == 0; });
    }

private:
    void drain_() {
        while (auto line = queue_.pop()) {
            emit(*line);
            done_();
        }
    }

    void done_() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (--pending_ == 0) {
            drained_.notify_all();
        }
    }

    mdi::common::BoundedQueue<Line> queue_;
    std::mutex mutex_;
    std::condition_variable drained_;
    std::size_t pending_ = 0;
    std::thread writer_;
};

Sink& sink() {
    static Sink instance;
    return instance;
}

}  // namespace

namespace logging {

std::atomic<config::LogLevel> Log::currentLevel{ config::LogLevel::Info };

void Log::set_log_level(config::LogLevel level) {
    currentLevel.store(level, std::memory_order_relaxed);
}

config::LogLevel Log::get_log_level() {
    return currentLevel.load(std::memory_order_relaxed);
}

void Log::flush() {
    sink().waitDrained();
}

bool Log::try_parse_log_level(std::string_view value, config::LogLevel& levelOut) {
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (normalized == "trace") {
        levelOut = config::LogLevel::Trace;
        return true;
    }
    if (normalized == "debug") {
        levelOut = config::LogLevel::Debug;
        return true;
    }
    if (normalized == "info") {
        levelOut = config::LogLevel::Info;
        return true;
    }
    if (normalized == "warn" || normalized == "warning") {
        levelOut = config::LogLevel::Warn;
        return true;
    }
    if (normalized == "error") {
        levelOut = config::LogLevel::Error;
        return true;
    }
    return false;
}

const char* Log::level_to_string(config::LogLevel level) {
    switch (level) {
    case config::LogLevel::Error:
        return "ERROR";
    case config::LogLevel::Warn:
        return "WARN";
    case config::LogLevel::Info:
        return "INFO";
    case config::LogLevel::Debug:
        return "DEBUG";
    case config::LogLevel::Trace:
        return "TRACE";
    }
    return "UNKNOWN";
}

const char* Log::category_to_string(LogCategory category) {
    switch (category) {
    case LogCategory::NET:
        return "NET";
    case LogCategory::DATA:
        return "DATA";
    case LogCategory::AGG:
        return "AGG";
    case LogCategory::JOBS:
        return "JOBS";
    case LogCategory::DB:
        return "DB";
    case LogCategory::HEALTH:
        return "HEALTH";
    }
    return "UNKNOWN";
}

void Log::log(config::LogLevel level, LogCategory category, const char* fmt, ...) {
    std::va_list args;
    va_start(args, fmt);
    vlog(level, category, fmt, args);
    va_end(args);
}

void Log::vlog(config::LogLevel level, LogCategory category, const char* fmt, std::va_list args) {
    if (config::logLevelSeverity(level) < config::logLevelSeverity(currentLevel.load(std::memory_order_relaxed))) {
        return;
    }

    std::array<char, kMessageBufferSize> buffer{};
    const int written = std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    if (written < 0) {
        std::snprintf(buffer.data(), buffer.size(), "<format-error>");
    }
    else if (static_cast<std::size_t>(written) >= buffer.size()) {
        std::fill(buffer.end() - 4, buffer.end() - 1, '.');
    }

    char prefix[32];
    std::snprintf(prefix, sizeof(prefix), " %-5s [%s] ", level_to_string(level), category_to_string(category));

    Line line{level, mdi::common::formatIsoMs(mdi::common::nowMs())};
    line.text.append(prefix);
    line.text.append(buffer.data());

    // A full queue drops low-severity lines; warnings and errors are written inline.
    if (!sink().offer(line) && (level == config::LogLevel::Error || level == config::LogLevel::Warn)) {
        emit(line);
    }
}

}  // namespace logging
