// VERISCORE - Logging System
// Copyright (c) 2024 VERISCORE Developers
// MIT License
//
// Leveled, category-filtered logging for the prover, verifier and tools.
// Messages are built with stream macros and handed to every registered sink.
// The console sink writes to stderr only: stdout carries command output
// (proof hex, commitments) and must stay parseable.

#ifndef VERISCORE_UTIL_LOGGING_H
#define VERISCORE_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace veriscore {
namespace util {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* PROVER = "prover";
    constexpr const char* VERIFIER = "verifier";
    constexpr const char* CIRCUIT = "circuit";
    constexpr const char* KEYS = "keys";
    constexpr const char* CODEC = "codec";
    constexpr const char* CONFIG = "config";
    constexpr const char* SERVICE = "service";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    const char* file{nullptr};
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

/// "2024-05-01 12:00:00.123 [INFO] [prover] message", with "file:line"
/// before the message when withSource is set
std::string FormatLogEntry(const LogEntry& entry, bool withSource);

/// File name without its directories
std::string GetBasename(const std::string& path);

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    explicit ILogSink(LogLevel level) : level_(level) {}
    virtual ~ILogSink() = default;

    /// Called for entries at or above the sink's level
    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() {}

    LogLevel GetLevel() const { return level_.load(); }
    void SetLevel(LogLevel level) { level_.store(level); }

private:
    std::atomic<LogLevel> level_;
};

class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(LogLevel level = LogLevel::Info, bool showTimestamp = true);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    bool showTimestamp_;
    std::mutex mutex_;
};

/// Appends to a log file; Warn and above are flushed immediately
class FileSink : public ILogSink {
public:
    FileSink(const std::string& path, LogLevel level = LogLevel::Debug);

    bool IsOpen() const { return file_.is_open(); }
    const std::string& Path() const { return path_; }

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    std::string path_;
    std::ofstream file_;
    std::mutex mutex_;
};

/// Forwards entries to a callback (tests, embedders)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Only these categories pass; an empty filter lets every category through
    void SetCategoryFilter(const std::vector<std::string>& categories);
    bool IsCategoryEnabled(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void Flush();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> Sinks() const;

    std::atomic<LogLevel> level_{LogLevel::Info};

    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;

    mutable std::mutex filterMutex_;
    std::set<std::string> categories_;
};

// ============================================================================
// Configuration Helper
// ============================================================================

/// Logging setup derived from configuration (see ConfigKeys)
struct LogOptions {
    LogLevel level{LogLevel::Info};
    bool printToConsole{true};
    std::string file;
    /// Empty means every category
    std::vector<std::string> categories;
};

/// Replace the logger's sinks and filters according to options.
/// Returns false if the log file could not be opened.
bool ConfigureLogging(const LogOptions& options);

// ============================================================================
// Log Stream
// ============================================================================

/// Collects one message and logs it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

#define VERISCORE_LOG(level, category) \
    if (!::veriscore::util::Logger::Instance().WillLog(::veriscore::util::LogLevel::level, \
                                                       category)) { \
    } else \
        ::veriscore::util::LogStream(::veriscore::util::LogLevel::level, category, \
                                     __FILE__, __LINE__)

#define LOG_TRACE(category)   VERISCORE_LOG(Trace, category)
#define LOG_DEBUG(category)   VERISCORE_LOG(Debug, category)
#define LOG_INFO(category)    VERISCORE_LOG(Info, category)
#define LOG_WARN(category)    VERISCORE_LOG(Warn, category)
#define LOG_ERROR(category)   VERISCORE_LOG(Error, category)

// ============================================================================
// Phase Timer
// ============================================================================

/**
 * Times the phases of one operation (witness, key, groth16, ...) and logs a
 * single Debug line when it goes out of scope:
 *
 *   prove threshold: witness=12ms key=0ms groth16=812ms total=824ms
 */
class PhaseTimer {
public:
    PhaseTimer(const char* category, std::string operation);
    ~PhaseTimer();

    PhaseTimer(const PhaseTimer&) = delete;
    PhaseTimer& operator=(const PhaseTimer&) = delete;

    /// Close the current phase under `name`
    void Phase(const std::string& name);

    int64_t ElapsedMs() const;

    const std::vector<std::pair<std::string, int64_t>>& Phases() const { return phases_; }

    /// "witness=12ms key=0ms total=12ms"
    std::string Summary() const;

private:
    using Clock = std::chrono::steady_clock;

    const char* category_;
    std::string operation_;
    Clock::time_point start_;
    Clock::time_point phaseStart_;
    std::vector<std::pair<std::string, int64_t>> phases_;
};

#define VERISCORE_LOG_TIMER(var, category, operation) \
    ::veriscore::util::PhaseTimer var(category, operation)

} // namespace util
} // namespace veriscore

#endif // VERISCORE_UTIL_LOGGING_H
