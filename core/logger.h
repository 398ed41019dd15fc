#pragma once
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace spellscribe {

enum class LogLevel { Info, Warning, Error };

// Asynchronous logger that writes messages to stderr and a log file.
class Logger {
public:
  // Access singleton instance, creating log file on first use.
  static Logger &Instance();

  // Selects the log file used by the singleton. Only effective before the
  // first call to Instance().
  static void SetLogFile(const std::string &path);

  // Queue a message to be logged.
  void Log(const std::string &msg);
  void Log(LogLevel level, const std::string &msg);

  void SetEchoToStderr(bool enabled);

  // Blocks until every queued message has been written.
  void Flush();

private:
  Logger();
  ~Logger();
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  void Worker();

  static std::string &LogFilePath();

  std::ofstream file_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable drained_;
  std::queue<std::string> queue_;
  bool done_ = false;
  bool busy_ = false;
  bool echo_ = true;
  std::thread worker_;
};

} // namespace spellscribe
