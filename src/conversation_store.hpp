#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "protocol.hpp"

// Append-only, in-memory record of sent and received messages. Queries
// return copies in insertion order.
class ConversationStore {
public:
  // No deduplication: recording the same id twice keeps both entries.
  void record(const Message& message);

  std::vector<Message> all() const;
  std::vector<Message> for_peer(const std::string& username) const;
  std::vector<Message> for_conversation(const std::string& conversation_id) const;

  std::size_t size() const;

private:
  template<typename Predicate>
  std::vector<Message> select(Predicate pred) const {
    std::vector<Message> out;
    std::lock_guard lg(m_);
    for(const auto& message : messages_) {
      if(pred(message)) out.push_back(message);
    }
    return out;
  }

  mutable std::mutex m_;
  std::vector<Message> messages_;
};
