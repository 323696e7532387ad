#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "log.hpp"
#include "protocol.hpp"
#include "transport.hpp"

class PeerTable;
class ConversationStore;

// Drains the transport and routes each packet: announcements to the peer
// table, messages addressed to us to the conversation store. Bad datagrams
// are logged and skipped; closing the transport ends the loop.
class ReceiveLoop {
public:
  using MessageCallback = std::function<void(const Message&)>;

  enum class Dispatch {
    PeerUpdated,
    SelfAnnouncement,
    MessageRecorded,
    MessageDropped,
    Malformed
  };

  struct Options {
    std::string username;
    bool stamp_receipt_time = true;
  };

  ReceiveLoop(Transport& transport,
              PeerTable& peers,
              ConversationStore& store,
              Options options,
              std::shared_ptr<Logger> logger = nullptr,
              MessageCallback on_message = nullptr);
  ~ReceiveLoop();

  ReceiveLoop(const ReceiveLoop&) = delete;
  ReceiveLoop& operator=(const ReceiveLoop&) = delete;

  void start();
  // Sets the stop flag, closes the transport to unblock receive() and joins.
  void stop();

  bool running() const { return running_.load(); }
  std::size_t received_count() const { return received_.load(); }
  std::size_t malformed_count() const { return malformed_.load(); }

  // One datagram through decode and dispatch. Never throws.
  Dispatch handle_datagram(const Transport::Datagram& datagram);

private:
  void run();
  Dispatch handle_announcement(const Packet& packet, const std::string& source_address);
  Dispatch handle_message(Packet packet);

  Transport& transport_;
  PeerTable& peers_;
  ConversationStore& store_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  MessageCallback on_message_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<std::size_t> received_{0};
  std::atomic<std::size_t> malformed_{0};
};
