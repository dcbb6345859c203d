#include "sim/actor_pool.hpp"

#include <iostream>
#include <stdexcept>

ActorPool::ActorPool(std::size_t workers) {
  if (workers == 0) throw std::invalid_argument("actor pool needs at least one worker");
  workers_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) workers_.emplace_back(&ActorPool::worker_loop_, this);
}

ActorPool::~ActorPool() {
  stop();
}

bool ActorPool::submit(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_) return false;
    jobs_.push_back(std::move(job));
  }
  work_cv_.notify_one();
  return true;
}

void ActorPool::wait_idle() {
  std::unique_lock<std::mutex> lk(mu_);
  idle_cv_.wait(lk, [this] { return jobs_.empty() && running_ == 0; });
}

void ActorPool::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_ && workers_.empty()) return;
    stopping_ = true;
  }
  work_cv_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
  workers_.clear();
}

void ActorPool::worker_loop_() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lk(mu_);
      work_cv_.wait(lk, [this] { return stopping_ || !jobs_.empty(); });
      if (jobs_.empty()) return;   // stopping and drained
      job = std::move(jobs_.front());
      jobs_.pop_front();
      ++running_;
    }

    try {
      job();
    } catch (const std::exception& e) {
      std::cerr << "[POOL][error] actor job failed: " << e.what() << "\n";
    } catch (...) {
      std::cerr << "[POOL][error] actor job failed: unknown fault\n";
    }

    {
      std::lock_guard<std::mutex> lk(mu_);
      --running_;
      if (jobs_.empty() && running_ == 0) idle_cv_.notify_all();
    }
  }
}
