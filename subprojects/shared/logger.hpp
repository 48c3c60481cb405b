#pragma once
#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <sstream>
#include <algorithm>
#include <climits>

// Usage:
//   g++ -DLOGGER_ENABLE_TRACE ...
//   logger.trace("rx", "frame boundary found");
// Traces are emitted regardless of per-sink log level thresholds.

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
#ifdef LOGGER_ENABLE_TRACE
    , Trace  // Highest so it survives retrieval filters
#endif
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
#ifdef LOGGER_ENABLE_TRACE
        case LogLevel::Trace:    return "TRACE";
#endif
        default:                 return "UNKNOWN";
    }
}

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(LogLevel level, const std::string& name, const std::string& message) = 0;
    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }

#ifdef LOGGER_ENABLE_TRACE
    // Trace bypasses level filtering; default no-op if not overridden.
    virtual void trace(const std::string& id, const std::string& message) {
        (void)id; (void)message;
    }
#endif
protected:
    LogLevel min_level_ = LogLevel::Info;
};

/** \brief Writes "[LEVEL] name: message" lines to an ostream (stdout or stderr). */
class StreamSink : public LogSink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}
    void log(LogLevel level, const std::string& name, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "[" << to_string(level) << "] " << name << ": " << message << std::endl;
    }
#ifdef LOGGER_ENABLE_TRACE
    void trace(const std::string& id, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "[TRACE][" << id << "] " << message << std::endl;
    }
#endif
private:
    std::ostream& out_;
    std::mutex mutex_;
};

class StdoutSink : public StreamSink {
public:
    StdoutSink() : StreamSink(std::cout) {}
};

// Default sink for the CLI: stdout may be carrying CoT output (log:stdout).
class StderrSink : public StreamSink {
public:
    StderrSink() : StreamSink(std::cerr) {}
};

class VectorSink : public LogSink {
public:
    void log(LogLevel level, const std::string& name, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << "[" << to_string(level) << "] " << name << ": " << message;
        lines_.push_back(oss.str());
        levels_.push_back(level);
    }
#ifdef LOGGER_ENABLE_TRACE
    void trace(const std::string& id, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << "[TRACE][" << id << "] " << message;
        lines_.push_back(oss.str());
        levels_.push_back(LogLevel::Trace);
    }
#endif
    std::vector<std::string> get_lines(size_t start = 0, size_t count = SIZE_MAX, LogLevel min_level = LogLevel::Debug) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> filtered;
        for (size_t i = 0; i < lines_.size(); ++i) {
            if (levels_[i] >= min_level) {
                filtered.push_back(lines_[i]);
            }
        }
        if (start >= filtered.size()) return {};
        size_t end = (std::min)(start + count, filtered.size());
        return std::vector<std::string>(filtered.begin() + start, filtered.begin() + end);
    }
    /** \brief True if any retained line at or above `min_level` contains `needle`. */
    bool contains(const std::string& needle, LogLevel min_level = LogLevel::Debug) const {
        for (const auto& line : get_lines(0, SIZE_MAX, min_level)) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }
private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    std::vector<LogLevel> levels_;
};

/**
 * \brief Process-wide diagnostics sink.
 * \details Created once in main (or per test) and handed to components as
 * `std::shared_ptr<Logger>`; components never create their own.
 */
class Logger {
public:
    Logger() : name_("tak-client") {}

    explicit Logger(const std::string& name) : name_(name) {}

    void add_sink(std::shared_ptr<LogSink> sink) {
        sinks_.push_back(std::move(sink));
    }

    /** \brief Apply `level` to every attached sink. */
    void set_level(LogLevel level) {
        for (const auto& sink : sinks_) sink->set_level(level);
    }

    void log(LogLevel level, const std::string& message) {
        for (const auto& sink : sinks_) {
            sink->log(level, name_, message);
        }
    }

#ifdef LOGGER_ENABLE_TRACE
    void trace(const std::string& id, const std::string& message) {
        for (const auto& sink : sinks_) {
            sink->trace(id, message); // Bypass level filtering
        }
    }
#endif

    void debug(const std::string& message)    { log(LogLevel::Debug, message); }
    void info(const std::string& message)     { log(LogLevel::Info, message); }
    void warning(const std::string& message)  { log(LogLevel::Warning, message); }
    void error(const std::string& message)    { log(LogLevel::Error, message); }
    void critical(const std::string& message) { log(LogLevel::Critical, message); }

    const std::string& name() const { return name_; }
    void set_name(const std::string& name) { name_ = name; }

    std::vector<std::string> get_lines(int start = 0, int count = INT_MAX, LogLevel min_level = LogLevel::Debug) const {
        for (const auto& sink : sinks_) {
            auto vector_sink = std::dynamic_pointer_cast<VectorSink>(sink);
            if (vector_sink) {
                return vector_sink->get_lines(static_cast<size_t>(start), static_cast<size_t>(count), min_level);
            }
        }
        return {};
    }

private:
    std::string name_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
};
