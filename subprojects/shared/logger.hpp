#pragma once
#include <iostream>
#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <sstream>
#include <algorithm>
#include <optional>
#include <cctype>

// Usage:
//   auto logger = std::make_shared<Logger>("Client");
//   logger->add_sink(std::make_shared<StdoutSink>());
//   logger->info("connected to localhost:3001");
// Compile with -DLINEBRIDGE_LOG_TRACE to get trace() output regardless of sink levels.

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
#ifdef LINEBRIDGE_LOG_TRACE
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
#ifdef LINEBRIDGE_LOG_TRACE
        case LogLevel::Trace:    return "TRACE";
#endif
        default:                 return "UNKNOWN";
    }
}

/// Case-insensitive level lookup for config/CLI values ("debug", "warn", ...).
inline std::optional<LogLevel> parse_log_level(const std::string& text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) lower.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    return std::nullopt;
}

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(LogLevel level, const std::string& source, const std::string& message) = 0;
    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }
    bool accepts(LogLevel level) const { return level >= min_level_; }

#ifdef LINEBRIDGE_LOG_TRACE
    virtual void trace(const std::string& id, const std::string& message) {
        (void)id; (void)message;
    }
#endif
protected:
    static std::string format(LogLevel level, const std::string& source, const std::string& message) {
        std::ostringstream oss;
        oss << "[" << to_string(level) << "]";
        if (!source.empty()) oss << "[" << source << "]";
        oss << " " << message;
        return oss.str();
    }

    LogLevel min_level_ = LogLevel::Info;
};

/// Console sink. Errors and above go to stderr unless split_errors is false.
class StdoutSink : public LogSink {
public:
    explicit StdoutSink(bool split_errors = true) : split_errors_(split_errors) {}

    void log(LogLevel level, const std::string& source, const std::string& message) override {
        if (!accepts(level)) return;
        const std::string line = format(level, source, message);
        std::lock_guard<std::mutex> lock(mutex_);
        if (split_errors_ && level >= LogLevel::Error) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << std::endl;
        }
    }
#ifdef LINEBRIDGE_LOG_TRACE
    void trace(const std::string& id, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[TRACE][" << id << "] " << message << std::endl;
    }
#endif
private:
    bool split_errors_;
    std::mutex mutex_;
};

/// Console sink that writes every level to stderr, keeping stdout for program output.
class StderrSink : public LogSink {
public:
    void log(LogLevel level, const std::string& source, const std::string& message) override {
        if (!accepts(level)) return;
        const std::string line = format(level, source, message);
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << line << std::endl;
    }
private:
    std::mutex mutex_;
};

/// In-memory sink; keeps every accepted line for later inspection.
class VectorSink : public LogSink {
public:
    void log(LogLevel level, const std::string& source, const std::string& message) override {
        if (!accepts(level)) return;
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(format(level, source, message));
        levels_.push_back(level);
    }
#ifdef LINEBRIDGE_LOG_TRACE
    void trace(const std::string& id, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back("[TRACE][" + id + "] " + message);
        levels_.push_back(LogLevel::Trace);
    }
#endif
    std::vector<std::string> get_lines(LogLevel min_level = LogLevel::Debug) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> filtered;
        for (size_t i = 0; i < lines_.size(); ++i) {
            if (levels_[i] >= min_level) {
                filtered.push_back(lines_[i]);
            }
        }
        return filtered;
    }

    /// True if any captured line contains `needle`.
    bool contains(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(lines_.begin(), lines_.end(),
                           [&](const std::string& l) { return l.find(needle) != std::string::npos; });
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.clear();
        levels_.clear();
    }
private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    std::vector<LogLevel> levels_;
};

class Logger {
public:
    Logger() : name_("Default") {}
    explicit Logger(const std::string& name) : name_(name) {}

    // Sinks are normally attached before the logger is shared with other threads.
    void add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sinks_.push_back(std::move(sink));
    }

    /// Apply one minimum level to every attached sink.
    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        for (const auto& sink : sinks_) sink->set_level(level);
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        for (const auto& sink : sinks_) {
            sink->log(level, name_, message);
        }
    }

#ifdef LINEBRIDGE_LOG_TRACE
    void trace(const std::string& id, const std::string& message) {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
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

private:
    std::string name_;
    std::mutex sinks_mutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
};
