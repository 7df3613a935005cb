#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

struct LoggerOptions {
  std::string path;  // empty logs to stderr only
  LogLevel min_level = LogLevel::INFO;
  bool mirror_stderr = false;
};

// Process-wide asynchronous logger. Lines are queued by callers and written by one
// background thread; nothing is logged before Initialize() or after Shutdown().
class Logger {
public:
  static void Initialize(const LoggerOptions& options);
  static void Shutdown();
  // "debug", "info", "warn"/"warning", "error", "critical"; unknown names fall back to INFO
  static LogLevel ParseLevel(const std::string& name);
  static void Log(LogLevel level, const std::string& message, const std::string& file = __FILE__, int line = __LINE__);
  static void Debug(const std::string& m, const std::string& f = __FILE__, int l = __LINE__);
  static void Info(const std::string& m, const std::string& f = __FILE__, int l = __LINE__);
  static void Warning(const std::string& m, const std::string& f = __FILE__, int l = __LINE__);
  static void Error(const std::string& m, const std::string& f = __FILE__, int l = __LINE__);
  static void Critical(const std::string& m, const std::string& f = __FILE__, int l = __LINE__);
  ~Logger();

private:
  struct Record {
    std::chrono::system_clock::time_point at;
    LogLevel level;
    std::string message;
    std::string file;
    int line;
    std::thread::id thread;
  };

  explicit Logger(const LoggerOptions& options);
  void Run();
  void Stop();
  std::string Format(const Record& r) const;

  static std::unique_ptr<Logger> instance_;
  static std::mutex instance_mutex_;

  LoggerOptions options_;
  std::ofstream file_;
  std::mutex queue_mutex_;
  std::condition_variable cv_;
  std::deque<Record> queue_;
  bool running_ = true;
  std::thread writer_;
};
