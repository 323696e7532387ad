#include "peer_table.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {

constexpr uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
constexpr uint64_t kFnvPrime = 0x100000001b3ULL;

uint64_t fnv1a_64(const std::string& data) {
  uint64_t hash = kFnvOffsetBasis;
  for(unsigned char c : data) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  return hash;
}

} // namespace

PeerTable::PeerTable(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

bool PeerTable::upsert(const std::string& username,
                       const std::string& address,
                       Clock::time_point now) {
  // log lines go out after the lock is released: listeners may read the table
  std::optional<std::string> moved_from;
  bool discovered = false;
  {
    std::lock_guard lg(m_);
    auto it = peers_.find(username);
    if(it == peers_.end()) {
      Peer p;
      p.username = username;
      p.address = address;
      p.first_seen = now;
      p.last_seen = now;
      peers_.emplace(username, std::move(p));
      discovered = true;
    } else {
      if(it->second.address != address) {
        moved_from = it->second.address;
        it->second.address = address;
      }
      // an out-of-order timestamp must not move last_seen behind first_seen
      it->second.last_seen = std::max(now, it->second.first_seen);
    }
  }

  if(discovered) {
    log_info(logger_.get(), "Discovered peer {} at {}", username, address);
    return true;
  }
  if(moved_from) {
    log_info(logger_.get(), "Peer {} moved {} -> {}", username, *moved_from, address);
  }
  log_debug(logger_.get(), "Updated peer {} at {}", username, address);
  return false;
}

std::vector<Peer> PeerTable::list_active(Clock::time_point now, Timeout timeout) {
  std::vector<Peer> active;
  std::vector<std::pair<std::string, double>> evicted;
  {
    std::lock_guard lg(m_);
    for(auto it = peers_.begin(); it != peers_.end();) {
      Timeout idle = now - it->second.last_seen;
      if(idle > timeout) {
        evicted.emplace_back(it->first, idle.count());
        it = peers_.erase(it);
        continue;
      }
      active.push_back(it->second);
      ++it;
    }
  }
  for(const auto& [username, idle] : evicted) {
    log_info(logger_.get(), "Removing {} - not seen for {:.1f} seconds", username, idle);
  }
  std::sort(active.begin(), active.end(), [](const Peer& a, const Peer& b){
    return a.username < b.username;
  });
  return active;
}

std::optional<Peer> PeerTable::find(const std::string& username) const {
  std::lock_guard lg(m_);
  auto it = peers_.find(username);
  if(it == peers_.end()) return std::nullopt;
  return it->second;
}

std::size_t PeerTable::size() const {
  std::lock_guard lg(m_);
  return peers_.size();
}

std::string PeerTable::conversation_id(const std::string& user_a,
                                       const std::string& user_b) {
  const std::string& low = std::min(user_a, user_b);
  const std::string& high = std::max(user_a, user_b);
  uint64_t hash = fnv1a_64(low + ":" + high);
  std::ostringstream oss;
  oss << std::nouppercase << std::hex << std::setfill('0') << std::setw(16) << hash;
  return oss.str().substr(0, kConversationIdLength);
}
