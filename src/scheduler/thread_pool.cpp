#include "scheduler/thread_pool.hpp"
#include <stdexcept>

ThreadPool::ThreadPool(size_t threads) {
  if (threads == 0) throw std::invalid_argument("thread pool needs at least one worker");
  threads_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) threads_.emplace_back(&ThreadPool::WorkerLoop, this);
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutting_down_ = true;
  }
  wake_.notify_all();
  for (auto& t : threads_) t.join();
}

void ThreadPool::WorkerLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    wake_.wait(lock, [this]{ return shutting_down_ || !queue_.empty(); });
    if (queue_.empty()) return;
    std::function<void()> task = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    task();
    lock.lock();
  }
}

void ThreadPool::Enqueue(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) throw std::runtime_error("thread pool is shutting down");
    queue_.push_back(std::move(task));
  }
  wake_.notify_one();
}

size_t ThreadPool::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}
