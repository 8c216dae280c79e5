#include "pcrc_log.hpp"

#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iostream>

static const char *ToString(const LogLevel level) {
    switch (level) {
        case DEBUG:
            return "DEBUG";
        case INFO:
            return "INFO";
        case WARN:
            return "WARN";
        case ERR:
            return "ERR";
        case FATAL:
            return "FATAL";
        case BUG:
            return "BUG";
        default:
            return "UNKNOWN";
    }
}

LogLevel Logger::parseLevel(const char *name) {
    if (name == nullptr) {
        return NONE;
    }
    if (strcmp(name, "DEBUG") == 0) {
        return DEBUG;
    }
    if (strcmp(name, "INFO") == 0) {
        return INFO;
    }
    if (strcmp(name, "WARN") == 0) {
        return WARN;
    }
    if (strcmp(name, "ERR") == 0) {
        return ERR;
    }
    if (strcmp(name, "FATAL") == 0) {
        return FATAL;
    }
    if (strcmp(name, "BUG") == 0) {
        return BUG;
    }
    return NONE;
}

static LogLevel readReportingLevel() {
    return Logger::parseLevel(getenv("PCRC_LOG_LEVEL"));
}

LogLevel Logger::reportingLevel = readReportingLevel();

NullStream::NullStream():
    std::ostream(&m_sb) {
}

Logger::Logger() :
    messageLevel(INFO) {
}

Logger::~Logger() {
    if (messageLevel >= reportingLevel) {
        os << std::endl;
        std::clog << os.str();
        if (messageLevel == FATAL) {
            exit(1);
        }
    }
}

std::ostream &Logger::getStream(const LogLevel level) {
    messageLevel = level;

    if (level >= reportingLevel) {
        time_t raw_time;
        tm time_info{};
        char buffer[32];
        time(&raw_time);
#ifdef _WIN32
        localtime_s(&time_info, &raw_time);
#else
        localtime_r(&raw_time, &time_info);
#endif
        strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &time_info);

        os << buffer << " - " << ToString(level) << ": ";

        return os;
    }

    thread_local NullStream null_stream;
    return null_stream;
}

LogLevel &Logger::getReportingLevel() {
    return reportingLevel;
}

void Logger::setReportingLevel(const LogLevel level) {
    reportingLevel = level;
}
