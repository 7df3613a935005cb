#include "telemetry/structured_logger.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <fstream>

StructuredLogger& StructuredLogger::Instance() {
  static StructuredLogger inst;
  return inst;
}

StructuredLogger::~StructuredLogger() { Shutdown(); }

void StructuredLogger::Initialize(const std::string& file_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!running_) {
    file_path_ = file_path;
    running_ = true;
    worker_ = std::thread(&StructuredLogger::Worker, this);
  }
}

void StructuredLogger::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

bool StructuredLogger::IsRunning() {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

void StructuredLogger::LogEvent(const std::string& event, nlohmann::json fields) {
  if (!fields.is_object()) fields = nlohmann::json::object();
  fields["ts"] = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  fields["event"] = event;
  LogJsonLine(fields.dump());
}

void StructuredLogger::LogJsonLine(const std::string& json_line) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    queue_.push(json_line);
  }
  cv_.notify_one();
}

void StructuredLogger::Worker() {
  std::ofstream out(file_path_, std::ios::app | std::ios::out);
  if (!out) Logger::Warning("Cannot open event log " + file_path_ + "; events are dropped");
  std::queue<std::string> pending;
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait_for(lock, std::chrono::milliseconds(80), [&]{ return !queue_.empty() || !running_; });
      if (queue_.empty() && !running_) return;
      std::swap(pending, queue_);
    }
    for (; !pending.empty(); pending.pop()) {
      if (out) out << pending.front() << '\n';
    }
    if (out) out.flush();
  }
}
