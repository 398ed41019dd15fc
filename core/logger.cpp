#include "logger.h"
#include <iostream>

namespace spellscribe {

namespace {
const char *LevelPrefix(LogLevel level) {
  switch (level) {
  case LogLevel::Warning:
    return "WARN  ";
  case LogLevel::Error:
    return "ERROR ";
  case LogLevel::Info:
  default:
    return "INFO  ";
  }
}
} // namespace

std::string &Logger::LogFilePath() {
  static std::string path = "spellscribe.log";
  return path;
}

void Logger::SetLogFile(const std::string &path) { LogFilePath() = path; }

Logger &Logger::Instance() {
  static Logger instance;
  return instance;
}

Logger::Logger() {
  if (!LogFilePath().empty())
    file_.open(LogFilePath(), std::ios::out | std::ios::trunc);
  worker_ = std::thread(&Logger::Worker, this);
}

Logger::~Logger() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_ = true;
  }
  cv_.notify_one();
  if (worker_.joinable())
    worker_.join();
  if (file_.is_open())
    file_.close();
}

void Logger::Log(const std::string &msg) { Log(LogLevel::Info, msg); }

void Logger::Log(LogLevel level, const std::string &msg) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::string(LevelPrefix(level)) + msg);
  }
  cv_.notify_one();
}

void Logger::SetEchoToStderr(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  echo_ = enabled;
}

void Logger::Flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  drained_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void Logger::Worker() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this] { return done_ || !queue_.empty(); });
    if (done_ && queue_.empty())
      break;
    auto msg = queue_.front();
    queue_.pop();
    busy_ = true;
    const bool echo = echo_;
    lock.unlock();
    if (file_.is_open()) {
      file_ << msg << std::endl;
      file_.flush();
    }
    if (echo)
      std::cerr << msg << std::endl;
    lock.lock();
    busy_ = false;
    if (queue_.empty())
      drained_.notify_all();
  }
  drained_.notify_all();
}

} // namespace spellscribe
