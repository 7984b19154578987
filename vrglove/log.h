#ifndef __VRGLOVE_LOG_H__
#define __VRGLOVE_LOG_H__

#include <cstdint>
#include <ctime>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

namespace vrglove {

class LogLevel {
public:
    enum Level {
        UNKNOWN = 0,
        DEBUG   = 1,
        INFO    = 2,
        WARN    = 3,
        ERROR   = 4,
        FATAL   = 5
    };

    static const char* ToString(LogLevel::Level level);
    static LogLevel::Level FromString(const std::string& str);
};

class Logger;

// One log line. Collects the streamed message and hands itself to the
// logger when the wrapping LogEventWrap goes out of scope.
class LogEvent {
public:
    typedef std::shared_ptr<LogEvent> ptr;
    LogEvent(std::shared_ptr<Logger> logger, LogLevel::Level level,
             const char* file, int32_t line, uint64_t thread_id, time_t time);

    const char*         getFile() const     { return file_; }
    int32_t             getLine() const     { return line_; }
    uint64_t            getThreadId() const { return thread_id_; }
    time_t              getTime() const     { return time_; }
    LogLevel::Level     getLevel() const    { return level_; }
    std::shared_ptr<Logger> getLogger() const { return logger_; }
    std::string         getContent() const  { return ss_.str(); }
    std::stringstream&  getSS()             { return ss_; }

private:
    const char*             file_ = nullptr;
    int32_t                 line_ = 0;
    uint64_t                thread_id_ = 0;
    time_t                  time_ = 0;
    std::stringstream       ss_;
    std::shared_ptr<Logger> logger_;
    LogLevel::Level         level_;
};

class LogEventWrap {
public:
    explicit LogEventWrap(LogEvent::ptr e);
    ~LogEventWrap();
    std::stringstream& getSS();

private:
    LogEvent::ptr event_;
};

class Logger : public std::enable_shared_from_this<Logger> {
public:
    typedef std::shared_ptr<Logger> ptr;

    explicit Logger(const std::string& name = "root");

    void log(LogLevel::Level level, LogEvent::ptr event);

    const std::string& getName() const { return name_; }

    // Level is shared by every logger in the process.
    static LogLevel::Level getLevel();
    static void setLevel(LogLevel::Level level);

private:
    std::string name_;
};

class LoggerManager {
public:
    static LoggerManager& instance();

    Logger::ptr getLogger(const std::string& name);
    Logger::ptr getRoot() const { return root_; }

private:
    LoggerManager();

    std::mutex                                   mutex_;
    std::unordered_map<std::string, Logger::ptr> loggers_;
    Logger::ptr                                  root_;
};

uint64_t current_thread_id();

} // namespace vrglove

#define VRGLOVE_LOG_LEVEL(logger, level) \
    if (logger && level >= vrglove::Logger::getLevel()) \
        vrglove::LogEventWrap(vrglove::LogEvent::ptr(new vrglove::LogEvent( \
            logger, level, __FILE__, __LINE__, \
            vrglove::current_thread_id(), time(0)))).getSS()

#define VRGLOVE_LOG_DEBUG(logger) VRGLOVE_LOG_LEVEL(logger, vrglove::LogLevel::DEBUG)
#define VRGLOVE_LOG_INFO(logger)  VRGLOVE_LOG_LEVEL(logger, vrglove::LogLevel::INFO)
#define VRGLOVE_LOG_WARN(logger)  VRGLOVE_LOG_LEVEL(logger, vrglove::LogLevel::WARN)
#define VRGLOVE_LOG_ERROR(logger) VRGLOVE_LOG_LEVEL(logger, vrglove::LogLevel::ERROR)
#define VRGLOVE_LOG_FATAL(logger) VRGLOVE_LOG_LEVEL(logger, vrglove::LogLevel::FATAL)

#define VRGLOVE_LOG_ROOT()        vrglove::LoggerManager::instance().getRoot()
#define VRGLOVE_LOG_NAME(name)    vrglove::LoggerManager::instance().getLogger(name)

#endif
