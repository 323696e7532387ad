#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

// Most recent engine debug lines, each stamped HH:MM:SS on arrival.
// Oldest lines fall off once capacity is reached.
class DebugLog {
public:
  static constexpr std::size_t kDefaultCapacity = 100;

  struct Entry {
    std::string time;
    std::string message;
  };

  explicit DebugLog(std::size_t capacity = kDefaultCapacity);

  void append(const std::string& message);
  std::vector<Entry> entries() const;
  void clear();

  std::size_t size() const;
  std::size_t capacity() const;
  void set_capacity(std::size_t capacity);

private:
  void trim_locked();

  mutable std::mutex m_;
  std::deque<Entry> entries_;
  std::size_t capacity_;
};
