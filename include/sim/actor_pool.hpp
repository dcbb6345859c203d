#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed set of worker threads draining a FIFO of jobs. Bounds how many rider
// actors run at once without changing what each actor does.
class ActorPool {
public:
  explicit ActorPool(std::size_t workers);
  ~ActorPool();

  ActorPool(const ActorPool&)            = delete;
  ActorPool& operator=(const ActorPool&) = delete;

  // Returns false once stop() has been called.
  bool submit(std::function<void()> job);

  // Blocks until the queue is empty and no job is running.
  void wait_idle();

  // Runs what is already queued, then joins the workers.
  void stop();

  std::size_t size() const { return workers_.size(); }

private:
  void worker_loop_();

  std::mutex                        mu_;
  std::condition_variable           work_cv_;
  std::condition_variable           idle_cv_;
  std::deque<std::function<void()>> jobs_;
  std::size_t                       running_  = 0;
  bool                              stopping_ = false;
  std::vector<std::thread>          workers_;
};
