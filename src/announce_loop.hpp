#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "log.hpp"

class Transport;

// Broadcasts "<username> is here" every interval until stopped. Send
// failures are logged and the next tick tries again; there is no backoff.
// running -> stopped only; a stopped loop cannot be restarted.
class AnnounceLoop {
public:
  using Interval = std::chrono::duration<double>;

  AnnounceLoop(Transport& transport,
               std::string username,
               Interval interval,
               std::shared_ptr<Logger> logger = nullptr);
  ~AnnounceLoop();

  AnnounceLoop(const AnnounceLoop&) = delete;
  AnnounceLoop& operator=(const AnnounceLoop&) = delete;

  void start();
  // Wakes the interval wait and joins. Safe to call more than once.
  void stop();

  bool running() const { return running_.load(); }
  std::size_t sent_count() const { return sent_.load(); }
  std::size_t failed_count() const { return failed_.load(); }

private:
  void run();
  void announce_once();

  Transport& transport_;
  std::string username_;
  std::chrono::microseconds interval_;
  std::shared_ptr<Logger> logger_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<std::size_t> sent_{0};
  std::atomic<std::size_t> failed_{0};
  bool failing_ = false;

  std::mutex wait_mutex_;
  std::condition_variable wake_;
  bool stop_requested_ = false;
};
