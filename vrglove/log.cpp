#include "log.h"

#include <atomic>
#include <functional>
#include <iostream>
#include <thread>

namespace vrglove {

static std::atomic<int> s_level{LogLevel::INFO};
static std::mutex       s_appender_mutex;

const char* LogLevel::ToString(LogLevel::Level level) {
    switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO";
    case WARN:  return "WARN";
    case ERROR: return "ERROR";
    case FATAL: return "FATAL";
    default:    return "UNKNOWN";
    }
}

LogLevel::Level LogLevel::FromString(const std::string& str) {
    if (str == "debug" || str == "DEBUG") return DEBUG;
    if (str == "info"  || str == "INFO")  return INFO;
    if (str == "warn"  || str == "WARN")  return WARN;
    if (str == "error" || str == "ERROR") return ERROR;
    if (str == "fatal" || str == "FATAL") return FATAL;
    return UNKNOWN;
}

LogEvent::LogEvent(std::shared_ptr<Logger> logger, LogLevel::Level level,
                   const char* file, int32_t line, uint64_t thread_id, time_t time)
    : file_(file),
      line_(line),
      thread_id_(thread_id),
      time_(time),
      logger_(std::move(logger)),
      level_(level)
{
}

LogEventWrap::LogEventWrap(LogEvent::ptr e)
    : event_(std::move(e))
{
}

LogEventWrap::~LogEventWrap() {
    event_->getLogger()->log(event_->getLevel(), event_);
}

std::stringstream& LogEventWrap::getSS() {
    return event_->getSS();
}

Logger::Logger(const std::string& name)
    : name_(name)
{
}

LogLevel::Level Logger::getLevel() {
    return static_cast<LogLevel::Level>(s_level.load(std::memory_order_relaxed));
}

void Logger::setLevel(LogLevel::Level level) {
    s_level.store(level, std::memory_order_relaxed);
}

void Logger::log(LogLevel::Level level, LogEvent::ptr event) {
    if (level < getLevel()) return;

    char time_buf[32];
    time_t t = event->getTime();
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &tm_buf);

    std::stringstream line;
    line << time_buf << "\t"
         << event->getThreadId() << "\t"
         << "[" << LogLevel::ToString(level) << "]\t"
         << "[" << name_ << "]\t"
         << event->getContent() << "\n";

    std::lock_guard<std::mutex> lock(s_appender_mutex);
    std::cerr << line.str();
    std::cerr.flush();
}

LoggerManager::LoggerManager()
    : root_(std::make_shared<Logger>("root"))
{
    loggers_[root_->getName()] = root_;
}

LoggerManager& LoggerManager::instance() {
    static LoggerManager mgr;
    return mgr;
}

Logger::ptr LoggerManager::getLogger(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loggers_.find(name);
    if (it != loggers_.end()) return it->second;
    auto logger = std::make_shared<Logger>(name);
    loggers_[name] = logger;
    return logger;
}

uint64_t current_thread_id() {
    return static_cast<uint64_t>(std::hash<std::thread::id>()(std::this_thread::get_id()));
}

} // namespace vrglove
