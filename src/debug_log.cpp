#include "debug_log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

std::string clock_time_now() {
  std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%H:%M:%S");
  return oss.str();
}

} // namespace

DebugLog::DebugLog(std::size_t capacity)
  : capacity_(capacity == 0 ? 1 : capacity) {}

void DebugLog::append(const std::string& message) {
  Entry entry{clock_time_now(), message};
  std::lock_guard lg(m_);
  entries_.push_back(std::move(entry));
  trim_locked();
}

std::vector<DebugLog::Entry> DebugLog::entries() const {
  std::lock_guard lg(m_);
  return {entries_.begin(), entries_.end()};
}

void DebugLog::clear() {
  std::lock_guard lg(m_);
  entries_.clear();
}

std::size_t DebugLog::size() const {
  std::lock_guard lg(m_);
  return entries_.size();
}

std::size_t DebugLog::capacity() const {
  std::lock_guard lg(m_);
  return capacity_;
}

void DebugLog::set_capacity(std::size_t capacity) {
  std::lock_guard lg(m_);
  capacity_ = capacity == 0 ? 1 : capacity;
  trim_locked();
}

void DebugLog::trim_locked() {
  while(entries_.size() > capacity_) {
    entries_.pop_front();
  }
}
