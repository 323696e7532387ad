#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"

struct Peer {
  using Clock = std::chrono::steady_clock;

  std::string username;
  std::string address;         // source IP of the latest announcement
  Clock::time_point first_seen{};
  Clock::time_point last_seen{};
};

// Liveness table keyed by username. Each call holds the table lock while it
// touches entries, so readers never see a half-updated entry. Log lines are
// emitted after the lock is released.
class PeerTable {
public:
  using Clock = Peer::Clock;
  using Timeout = std::chrono::duration<double>;

  static constexpr std::size_t kConversationIdLength = 8;

  explicit PeerTable(std::shared_ptr<Logger> logger = nullptr);

  // Returns true when the username was not known yet.
  bool upsert(const std::string& username,
              const std::string& address,
              Clock::time_point now);

  // Active peers sorted by username. Peers idle for longer than `timeout`
  // are dropped from the table as a side effect.
  std::vector<Peer> list_active(Clock::time_point now, Timeout timeout);

  std::optional<Peer> find(const std::string& username) const;
  std::size_t size() const;

  // Order-independent id for the conversation between two usernames:
  // FNV-1a over "low:high", first kConversationIdLength hex digits.
  static std::string conversation_id(const std::string& user_a,
                                     const std::string& user_b);

private:
  mutable std::mutex m_;
  std::unordered_map<std::string, Peer> peers_;
  std::shared_ptr<Logger> logger_;
};
