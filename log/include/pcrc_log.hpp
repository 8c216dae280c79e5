#ifndef PCRC_LOG_H
#define PCRC_LOG_H

#include <sstream>

enum LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERR,
    FATAL,
    BUG,
    NONE
};

class NullBuffer final : public std::streambuf {
public:
    int overflow(const int c) override { return c; }
};

class NullStream final : public std::ostream {
public:
    NullStream();

private:
    NullBuffer m_sb;
};

/// Line-buffered logger writing to stderr.
/// One instance per log statement; the line is flushed when the instance is destroyed.
class Logger final {
public:
    Logger();

    ~Logger();

    std::ostream &getStream(LogLevel level);

    static LogLevel &getReportingLevel();

    static void setReportingLevel(LogLevel level);

    /// Parses a level name as used in PCRC_LOG_LEVEL; unknown names map to NONE
    static LogLevel parseLevel(const char *name);

    Logger(const Logger &) = delete;

    Logger &operator=(const Logger &) = delete;

private:
    static LogLevel reportingLevel;
    std::ostringstream os;
    LogLevel messageLevel;
};

#define LOG(level) \
Logger().getStream(level)


#endif // PCRC_LOG_H
