#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "conversation_store.hpp"
#include "log.hpp"
#include "peer_table.hpp"
#include "protocol.hpp"

class AnnounceLoop;
class ReceiveLoop;
class SettingsManager;
class Transport;

// Facade over the discovery core: one UDP transport, the announce and
// receive loops, the peer table and the conversation store. Every public
// call is synchronous and may come from any thread.
class DiscoveryEngine {
public:
  using DebugSink = std::function<void(const std::string&)>;
  using MessageCallback = std::function<void(const Message&)>;

  struct Options {
    // Overrides the "username" setting when non-empty.
    std::string username;
    // Receives every engine log line while debug logging is on.
    DebugSink debug_sink;
    // Called on the receive thread for each message addressed to us.
    MessageCallback on_message;
  };

  struct SendResult {
    enum class Status { Sent, PeerUnknown, TransportFailed };

    Status status = Status::PeerUnknown;
    std::optional<Message> message;
    std::string error;

    bool ok() const { return status == Status::Sent; }
    explicit operator bool() const { return ok(); }
  };

  struct Stats {
    std::size_t known_peers = 0;
    std::size_t stored_messages = 0;
    std::size_t announcements_sent = 0;
    std::size_t datagrams_received = 0;
    std::size_t malformed_datagrams = 0;
  };

  // Throws std::invalid_argument when no username is configured.
  DiscoveryEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~DiscoveryEngine();

  DiscoveryEngine(const DiscoveryEngine&) = delete;
  DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

  // Opens the transport and launches both loops; returns immediately.
  // Throws std::runtime_error for bad settings and TransportError when the
  // port cannot be bound. No-op while running.
  void start();
  // Closes the transport and joins both loops. Peers and messages survive,
  // and start() may be called again.
  void stop();
  bool running() const { return running_.load(); }

  std::vector<Peer> list_peers();

  SendResult send_message(const std::string& recipient,
                          const std::string& title,
                          const std::string& content,
                          std::optional<std::string> conversation_id = std::nullopt,
                          std::optional<std::string> reply_to = std::nullopt);

  std::vector<Message> list_messages(const std::optional<std::string>& peer = std::nullopt) const;
  std::vector<Message> get_conversation(const std::string& conversation_id) const;

  // Replaces Options::on_message; nullptr detaches. Takes effect for the
  // next message, also while running.
  void set_message_callback(MessageCallback callback);
  void set_debug_sink(DebugSink sink);

  void set_debug_logging(bool enabled);
  bool debug_logging() const { return debug_enabled_.load(); }

  LogListenerHandle add_log_listener(Logger::Listener listener);
  void remove_log_listener(LogListenerHandle handle);

  const std::string& username() const { return username_; }
  uint16_t port() const;
  Stats stats() const;

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  struct Config {
    uint16_t port = 0;
    double peer_timeout = 0;
    double broadcast_interval = 0;
    std::string broadcast_address;
    bool stamp_receipt_time = true;
  };

  Config read_config() const;
  void dispatch_message(const Message& message);
  void dispatch_debug_line(const std::string& line);

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::string username_;
  std::shared_ptr<Logger> logger_;
  PeerTable peers_;
  ConversationStore store_;

  // serialises start()/stop(); never taken by queries
  std::mutex transition_mutex_;
  mutable std::mutex lifecycle_mutex_;
  Config config_;
  std::unique_ptr<Transport> transport_;
  std::unique_ptr<AnnounceLoop> announce_loop_;
  std::unique_ptr<ReceiveLoop> receive_loop_;
  std::atomic<bool> running_{false};

  std::mutex callback_mutex_;
  MessageCallback message_callback_;
  DebugSink debug_sink_;

  std::atomic<bool> debug_enabled_{false};
  LogListenerHandle debug_listener_ = 0;
};
