#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Counting semaphore bounding the fetch workers.
class Gate {
 public:
  explicit Gate(size_t permits) : avail_(permits == 0 ? 1 : permits) {
  }

  void acquire() {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait(lk, [&] { return avail_ > 0; });
    --avail_;
  }

  // Waits for a permit, giving up when `cancelled` becomes true or the
  // deadline passes. Returns whether a permit was taken.
  bool acquire_until(std::chrono::steady_clock::time_point deadline,
                     const std::atomic<bool>* cancelled) {
    using namespace std::chrono_literals;
    std::unique_lock<std::mutex> lk(m_);
    for (;;) {
      if (cancelled != nullptr && cancelled->load())
        return false;
      if (avail_ > 0)
        break;
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline)
        return false;
      // cancellation is a plain flag, so poll it
      auto slice = std::min<std::chrono::steady_clock::duration>(
        deadline - now, 100ms);
      cv_.wait_for(lk, slice);
    }
    --avail_;
    return true;
  }

  void release() {
    std::lock_guard<std::mutex> lk(m_);
    ++avail_;
    cv_.notify_one();
  }

  // Returns the permit on scope exit, exceptions included.
  class Permit {
   public:
    explicit Permit(Gate& g) : g_(&g) {
    }
    Permit(Permit&& other) noexcept : g_(other.g_) {
      other.g_ = nullptr;
    }
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;
    Permit& operator=(Permit&&) = delete;
    ~Permit() {
      if (g_ != nullptr)
        g_->release();
    }

   private:
    Gate* g_;
  };

 private:
  std::mutex m_;
  std::condition_variable cv_;
  size_t avail_;
};
