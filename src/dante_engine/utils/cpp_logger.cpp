#include "cpp_logger.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <deque>
#include <mutex>
#include <utility>
#include <iostream>

namespace dantebridge {
namespace engine {
namespace logging {

std::atomic<LogLevel> current_log_level{LogLevel::INFO};

namespace {

constexpr std::size_t kQueueCapacity = 2048;
constexpr std::size_t kBatchLimit = 100;
constexpr std::size_t kInitialFormatBuffer = 512;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERR: return "ERROR";
    }
    return "?";
}

/**
 * Bounded drop-oldest queue drained by the host. At most one overflow marker is
 * queued until a drain brings the backlog under half capacity.
 */
class LogQueue {
public:
    void push(LogEntry entry) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            if (entries_.size() >= kQueueCapacity) {
                entries_.pop_front();
                if (!overflow_marked_) {
                    LogEntry marker;
                    marker.level = LogLevel::WARNING;
                    marker.message = "C++ log queue overflow, oldest messages dropped";
                    marker.filename = "cpp_logger.cpp";
                    marker.line_number = __LINE__;
                    entries_.push_back(std::move(marker));
                    overflow_marked_ = true;
                }
            }
            entries_.push_back(std::move(entry));
        }
        ready_.notify_one();
    }

    std::vector<LogEntry> drain(int timeout_ms) {
        std::vector<LogEntry> batch;
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait_for(lock, std::chrono::milliseconds(std::max(timeout_ms, 0)),
                        [this] { return !entries_.empty() || closed_; });
        if (entries_.empty()) {
            return batch;
        }

        const std::size_t count = std::min(entries_.size(), kBatchLimit);
        batch.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            batch.push_back(std::move(entries_.front()));
            entries_.pop_front();
        }
        if (overflow_marked_ && entries_.size() < kQueueCapacity / 2) {
            overflow_marked_ = false;
        }
        return batch;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<LogEntry> entries_;
    bool overflow_marked_ = false;
    bool closed_ = false;
};

LogQueue& queue() {
    static LogQueue instance;
    return instance;
}

std::atomic<bool> mirror_to_stderr{false};

} // namespace

void set_cpp_log_level(LogLevel level) {
    current_log_level.store(level);
}

LogLevel get_cpp_log_level() {
    return current_log_level.load();
}

void set_cpp_log_stderr(bool enabled) {
    mirror_to_stderr.store(enabled);
}

const char* get_base_filename(const char* path) {
    if (!path) {
        return "";
    }
    const char* base = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/' || *p == '\\') {
            base = p + 1;
        }
    }
    return base;
}

void log_message(LogLevel level, const char* file, int line, const char* format, ...) {
    if (static_cast<int>(level) < static_cast<int>(current_log_level.load())) {
        return;
    }

    std::string text(kInitialFormatBuffer, '\0');
    va_list args;
    va_start(args, format);
    int needed = vsnprintf(&text[0], text.size(), format, args);
    va_end(args);
    if (needed < 0) {
        std::cerr << "CppLogger: bad format at " << (file ? file : "?") << ":" << line << std::endl;
        return;
    }
    if (static_cast<std::size_t>(needed) >= text.size()) {
        text.assign(static_cast<std::size_t>(needed) + 1, '\0');
        va_start(args, format);
        vsnprintf(&text[0], text.size(), format, args);
        va_end(args);
    }
    text.resize(static_cast<std::size_t>(needed));

    if (mirror_to_stderr.load()) {
        std::cerr << "[" << level_tag(level) << "] " << (file ? file : "?") << ":" << line
                  << " " << text << std::endl;
    }

    LogEntry entry;
    entry.level = level;
    entry.message = std::move(text);
    entry.filename = file ? file : "unknown_file";
    entry.line_number = line;
    queue().push(std::move(entry));
}

std::vector<LogEntry> retrieve_log_entries(int timeout_ms) {
    return queue().drain(timeout_ms);
}

void shutdown_cpp_logger() {
    queue().close();
}

} // namespace logging
} // namespace engine
} // namespace dantebridge
