#include "conversation_store.hpp"

void ConversationStore::record(const Message& message) {
  std::lock_guard lg(m_);
  messages_.push_back(message);
}

std::vector<Message> ConversationStore::all() const {
  std::lock_guard lg(m_);
  return messages_;
}

std::vector<Message> ConversationStore::for_peer(const std::string& username) const {
  return select([&](const Message& m){
    return m.sender == username || m.recipient == username;
  });
}

std::vector<Message> ConversationStore::for_conversation(const std::string& conversation_id) const {
  return select([&](const Message& m){
    return m.conversation_id && *m.conversation_id == conversation_id;
  });
}

std::size_t ConversationStore::size() const {
  std::lock_guard lg(m_);
  return messages_.size();
}
