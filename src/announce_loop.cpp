#include "announce_loop.hpp"
#include "errors.hpp"
#include "protocol.hpp"
#include "transport.hpp"

AnnounceLoop::AnnounceLoop(Transport& transport,
                           std::string username,
                           Interval interval,
                           std::shared_ptr<Logger> logger)
  : transport_(transport),
    username_(std::move(username)),
    interval_(std::chrono::duration_cast<std::chrono::microseconds>(interval)),
    logger_(std::move(logger)) {
  if(interval_.count() <= 0) {
    interval_ = std::chrono::milliseconds(100);
  }
}

AnnounceLoop::~AnnounceLoop() {
  stop();
}

void AnnounceLoop::start() {
  if(running_ || stopped_) return;
  running_ = true;
  thread_ = std::thread([this](){ run(); });
}

void AnnounceLoop::stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_ = true;
  }
  wake_.notify_all();
  if(thread_.joinable()) {
    thread_.join();
  }
  stopped_ = true;
  running_ = false;
}

void AnnounceLoop::run() {
  log_debug(logger_.get(), "Announcing {} every {} ms", username_, interval_.count() / 1000.0);
  std::unique_lock<std::mutex> lock(wait_mutex_);
  while(!stop_requested_) {
    lock.unlock();
    announce_once();
    lock.lock();
    wake_.wait_for(lock, interval_, [this]{ return stop_requested_; });
  }
  log_debug(logger_.get(), "Announce loop stopped");
}

void AnnounceLoop::announce_once() {
  auto payload = encode_packet(Packet::announcement(username_, timestamp_now()));
  try {
    transport_.broadcast(payload);
    ++sent_;
    if(failing_) {
      failing_ = false;
      log_info(logger_.get(), "Broadcast recovered");
    }
    log_debug(logger_.get(), "Broadcasting presence: {}", username_);
  } catch(const TransportError& e) {
    ++failed_;
    // only the first failure of a streak is a warning
    if(!failing_) {
      failing_ = true;
      log_warn(logger_.get(), "Broadcast error: {}", e.what());
    } else {
      log_debug(logger_.get(), "Broadcast error: {}", e.what());
    }
  }
}
