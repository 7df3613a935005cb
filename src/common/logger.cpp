#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

std::unique_ptr<Logger> Logger::instance_;
std::mutex Logger::instance_mutex_;

namespace {
  const char* LevelName(LogLevel level) {
    switch (level) {
      case LogLevel::DEBUG: return "DEBUG";
      case LogLevel::INFO: return "INFO";
      case LogLevel::WARNING: return "WARN";
      case LogLevel::ERROR: return "ERROR";
      case LogLevel::CRITICAL: return "CRIT";
    }
    return "UNK";
  }

  // 2026-01-31 12:00:00.123, UTC
  std::string Timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
  }

  std::string FileName(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
  }
}

Logger::Logger(const LoggerOptions& options) : options_(options) {
  if (options_.path.empty()) {
    options_.mirror_stderr = true;
  } else {
    file_.open(options_.path, std::ios::out | std::ios::app);
    if (!file_) {
      std::cerr << "cannot open log file " << options_.path << ", logging to stderr" << std::endl;
      options_.mirror_stderr = true;
    }
  }
  writer_ = std::thread(&Logger::Run, this);
}

Logger::~Logger() { Stop(); }

void Logger::Initialize(const LoggerOptions& options) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (instance_) return;
  instance_.reset(new Logger(options));
}

void Logger::Shutdown() {
  std::unique_ptr<Logger> inst;
  {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    inst = std::move(instance_);
  }
  if (inst) inst->Stop();
}

void Logger::Stop() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (writer_.joinable()) writer_.join();
}

LogLevel Logger::ParseLevel(const std::string& name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (s == "debug" || s == "trace") return LogLevel::DEBUG;
  if (s == "warn" || s == "warning") return LogLevel::WARNING;
  if (s == "error") return LogLevel::ERROR;
  if (s == "critical" || s == "crit") return LogLevel::CRITICAL;
  return LogLevel::INFO;
}

void Logger::Run() {
  std::deque<Record> batch;
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      cv_.wait(lock, [&]{ return !queue_.empty() || !running_; });
      if (queue_.empty() && !running_) return;
      batch.swap(queue_);
    }
    std::string text;
    for (const auto& r : batch) text += Format(r);
    batch.clear();
    if (file_.is_open()) file_ << text << std::flush;
    if (options_.mirror_stderr) std::cerr << text;
  }
}

std::string Logger::Format(const Record& r) const {
  std::ostringstream oss;
  oss << Timestamp(r.at) << " [" << LevelName(r.level) << "] (" << r.thread << ") "
      << FileName(r.file) << ':' << r.line << " - " << r.message << '\n';
  return oss.str();
}

void Logger::Log(LogLevel level, const std::string& message, const std::string& file, int line) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_ || level < instance_->options_.min_level) return;
  {
    std::lock_guard<std::mutex> qlock(instance_->queue_mutex_);
    instance_->queue_.push_back(Record{std::chrono::system_clock::now(), level, message, file, line,
                                       std::this_thread::get_id()});
  }
  instance_->cv_.notify_one();
}

void Logger::Debug(const std::string& m, const std::string& f, int l) { Log(LogLevel::DEBUG, m, f, l); }
void Logger::Info(const std::string& m, const std::string& f, int l) { Log(LogLevel::INFO, m, f, l); }
void Logger::Warning(const std::string& m, const std::string& f, int l) { Log(LogLevel::WARNING, m, f, l); }
void Logger::Error(const std::string& m, const std::string& f, int l) { Log(LogLevel::ERROR, m, f, l); }
void Logger::Critical(const std::string& m, const std::string& f, int l) { Log(LogLevel::CRITICAL, m, f, l); }
