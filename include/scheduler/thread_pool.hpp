#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed set of quote workers draining one FIFO queue. The destructor runs every
// queued task before joining.
class ThreadPool {
public:
  explicit ThreadPool(size_t threads);
  ~ThreadPool();
  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Throws std::runtime_error once shutdown has begun
  void Enqueue(std::function<void()> task);

  // Runs fn on a worker; exceptions surface through the returned future
  template <class F>
  std::future<typename std::invoke_result<F>::type> Submit(F fn) {
    using R = typename std::invoke_result<F>::type;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    std::future<R> result = task->get_future();
    Enqueue([task]{ (*task)(); });
    return result;
  }

  size_t Size() const { return threads_.size(); }
  // Tasks queued and not yet picked up by a worker
  size_t Pending() const;

private:
  void WorkerLoop();

  std::vector<std::thread> threads_;
  std::deque<std::function<void()>> queue_;
  mutable std::mutex mutex_;
  std::condition_variable wake_;
  bool shutting_down_ = false;
};
