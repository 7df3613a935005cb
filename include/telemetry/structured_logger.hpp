#pragma once
#include <condition_variable>
#include <mutex>
#include <nlohmann/json.hpp>
#include <queue>
#include <string>
#include <thread>

// Append-only JSON-lines event sink with a background writer.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  // Starts the writer; later calls are ignored until Shutdown()
  void Initialize(const std::string& file_path);
  // Adds "ts" (unix ms) and "event" to fields and enqueues one line
  void LogEvent(const std::string& event, nlohmann::json fields);
  // Enqueue a pre-built JSON line (one object, no trailing newline needed)
  void LogJsonLine(const std::string& json_line);
  // Drains the queue and stops the writer
  void Shutdown();
  bool IsRunning();
private:
  StructuredLogger() = default;
  ~StructuredLogger();
  void Worker();
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  bool running_ = false;
  std::string file_path_;
};
