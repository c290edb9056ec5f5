#pragma once

#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

class Logger {
public:
    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::INFO, bool echo = true);
    static void shutdown();
    static void setLogLevel(LogLevel level);
    static bool parseLevel(const std::string& text, LogLevel& level);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);
    static bool isInitialized();

private:
    static void log(LogLevel level, const std::string& message);
    static std::string levelToString(LogLevel level);

    static std::mutex mutex_;
    static LogLevel currentLevel_;
    static bool initialized_;
    static bool echo_;
    static std::string logPath_;
    static std::ofstream file_;
};

// Log handle scoped to one job run; every line carries the job id
class JobLogger {
public:
    explicit JobLogger(std::string jobId = "") : prefix_(makePrefix(jobId)) {}

    void setJobId(const std::string& jobId) { prefix_ = makePrefix(jobId); }

    void debug(const std::string& message) const { Logger::debug(prefix_ + message); }
    void info(const std::string& message) const { Logger::info(prefix_ + message); }
    void warning(const std::string& message) const { Logger::warning(prefix_ + message); }
    void error(const std::string& message) const { Logger::error(prefix_ + message); }

private:
    static std::string makePrefix(const std::string& jobId) {
        return jobId.empty() ? std::string() : "[job " + jobId + "] ";
    }

    std::string prefix_;
};
