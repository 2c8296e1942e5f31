// VERISCORE - Logging Implementation
// Copyright (c) 2024 VERISCORE Developers
// MIT License

#include "veriscore/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

namespace veriscore {
namespace util {

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::pair<const char*, LogLevel> NAMES[] = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},   {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn}, {"error", LogLevel::Error},
        {"off", LogLevel::Off},     {"none", LogLevel::Off},
    };
    for (const auto& [name, level] : NAMES) {
        if (lower == name) {
            return level;
        }
    }
    return LogLevel::Info;
}

std::string GetBasename(const std::string& path) {
    const size_t pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string FormatLogEntry(const LogEntry& entry, bool withSource) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(entry.timestamp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            entry.timestamp.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis
        << " [" << LogLevelToString(entry.level) << "] ";
    if (!entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        out << "[" << entry.category << "] ";
    }
    if (withSource && entry.file != nullptr) {
        out << GetBasename(entry.file) << ":" << entry.line << " ";
    }
    out << entry.message;
    return out.str();
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(LogLevel level, bool showTimestamp)
    : ILogSink(level), showTimestamp_(showTimestamp) {}

void ConsoleSink::Write(const LogEntry& entry) {
    std::string line;
    if (showTimestamp_) {
        line = FormatLogEntry(entry, false);
    } else {
        line = std::string(LogLevelToString(entry.level)) + ": " + entry.message;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s\n", line.c_str());
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stderr);
}

FileSink::FileSink(const std::string& path, LogLevel level)
    : ILogSink(level), path_(path), file_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(const LogEntry& entry) {
    const std::string line = FormatLogEntry(entry, true);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    file_ << line << '\n';
    if (entry.level >= LogLevel::Warn) {
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.flush();
}

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : ILogSink(level), callback_(std::move(callback)) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (callback_) {
        callback_(entry);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

std::vector<std::shared_ptr<ILogSink>> Logger::Sinks() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_;
}

void Logger::SetCategoryFilter(const std::vector<std::string>& categories) {
    std::lock_guard<std::mutex> lock(filterMutex_);
    categories_ = std::set<std::string>(categories.begin(), categories.end());
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(filterMutex_);
    return categories_.empty() || categories_.count(category) > 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    return level != LogLevel::Off && level >= level_.load() && IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file;
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();

    // Sinks lock themselves; a snapshot keeps slow sinks from blocking AddSink
    for (const auto& sink : Sinks()) {
        if (level >= sink->GetLevel()) {
            sink->Write(entry);
        }
    }
}

void Logger::Flush() {
    for (const auto& sink : Sinks()) {
        sink->Flush();
    }
}

bool ConfigureLogging(const LogOptions& options) {
    Logger& logger = Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(options.level);
    logger.SetCategoryFilter(options.categories);

    if (options.printToConsole) {
        logger.AddSink(std::make_shared<ConsoleSink>(options.level));
    }
    if (options.file.empty()) {
        return true;
    }

    auto sink = std::make_shared<FileSink>(options.file, options.level);
    if (!sink->IsOpen()) {
        return false;
    }
    logger.AddSink(std::move(sink));
    return true;
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

// ============================================================================
// PhaseTimer
// ============================================================================

PhaseTimer::PhaseTimer(const char* category, std::string operation)
    : category_(category)
    , operation_(std::move(operation))
    , start_(Clock::now())
    , phaseStart_(start_) {}

PhaseTimer::~PhaseTimer() {
    LOG_DEBUG(category_) << operation_ << ": " << Summary();
}

void PhaseTimer::Phase(const std::string& name) {
    const Clock::time_point now = Clock::now();
    phases_.emplace_back(
        name, std::chrono::duration_cast<std::chrono::milliseconds>(now - phaseStart_).count());
    phaseStart_ = now;
}

int64_t PhaseTimer::ElapsedMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_).count();
}

std::string PhaseTimer::Summary() const {
    std::ostringstream out;
    for (const auto& [name, ms] : phases_) {
        out << name << "=" << ms << "ms ";
    }
    out << "total=" << ElapsedMs() << "ms";
    return out.str();
}

} // namespace util
} // namespace veriscore
