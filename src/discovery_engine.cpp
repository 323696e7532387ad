#include "discovery_engine.hpp"

#include <stdexcept>

#include "announce_loop.hpp"
#include "errors.hpp"
#include "receive_loop.hpp"
#include "settings_manager.hpp"
#include "transport.hpp"

namespace {

std::string resolve_username(const DiscoveryEngine::Options& options,
                             const SettingsManager& settings) {
  if(!options.username.empty()) return options.username;
  return settings.get<std::string>("username");
}

} // namespace

DiscoveryEngine::DiscoveryEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    username_(resolve_username(options_, *settings_)),
    logger_(std::make_shared<Logger>(username_)),
    peers_(logger_) {
  if(username_.empty()) {
    throw std::invalid_argument("DiscoveryEngine needs a username");
  }
  config_ = read_config();
  debug_enabled_ = settings_->get<bool>("debug");
  message_callback_ = options_.on_message;
  debug_sink_ = options_.debug_sink;

  debug_listener_ = logger_->add_listener(
    [this](const std::string&, spdlog::level::level_enum, const std::string& message){
      if(debug_enabled_) {
        dispatch_debug_line(message);
      }
      return false;
    });
}

DiscoveryEngine::~DiscoveryEngine() {
  stop();
  if(debug_listener_ != 0) {
    logger_->remove_listener(debug_listener_);
  }
}

DiscoveryEngine::Config DiscoveryEngine::read_config() const {
  Config c;
  int port_value = settings_->get<int>("port");
  if(port_value < 0 || port_value > 65535) {
    throw std::runtime_error("Invalid port " + std::to_string(port_value));
  }
  c.port = static_cast<uint16_t>(port_value);

  c.peer_timeout = settings_->get<double>("peer_timeout");
  if(!(c.peer_timeout > 0)) {
    throw std::runtime_error("peer_timeout must be positive");
  }
  c.broadcast_interval = settings_->get<double>("broadcast_interval");
  if(!(c.broadcast_interval > 0)) {
    throw std::runtime_error("broadcast_interval must be positive");
  }
  c.broadcast_address = settings_->get<std::string>("broadcast_address");
  c.stamp_receipt_time = settings_->get<bool>("stamp_receipt_time");
  return c;
}

void DiscoveryEngine::start() {
  std::lock_guard transition(transition_mutex_);
  if(running_) return;

  // logging happens outside lifecycle_mutex_: listeners may query the engine
  Config config = read_config();
  auto transport = std::make_unique<Transport>(config.port, config.broadcast_address, logger_);
  try {
    transport->open();
  } catch(const TransportError& e) {
    logger_->error("Unable to open UDP port {}: {}", config.port, e.what());
    throw;
  }
  const uint16_t bound_port = transport->port();

  {
    std::lock_guard lg(lifecycle_mutex_);
    // loops from a previous run still reference the old transport
    announce_loop_.reset();
    receive_loop_.reset();
    config_ = config;
    transport_ = std::move(transport);

    ReceiveLoop::Options receive_options;
    receive_options.username = username_;
    receive_options.stamp_receipt_time = config_.stamp_receipt_time;
    receive_loop_ = std::make_unique<ReceiveLoop>(*transport_, peers_, store_,
                                                  receive_options, logger_,
                                                  [this](const Message& m){ dispatch_message(m); });
    announce_loop_ = std::make_unique<AnnounceLoop>(*transport_, username_,
                                                    AnnounceLoop::Interval(config_.broadcast_interval),
                                                    logger_);
  }
  receive_loop_->start();
  announce_loop_->start();
  running_ = true;
  logger_->info("Discovery started as {} on UDP port {}", username_, bound_port);
}

void DiscoveryEngine::stop() {
  std::lock_guard transition(transition_mutex_);
  AnnounceLoop* announce = nullptr;
  ReceiveLoop* receive = nullptr;
  Transport* transport = nullptr;
  {
    std::lock_guard lg(lifecycle_mutex_);
    if(!running_) return;
    running_ = false;
    announce = announce_loop_.get();
    receive = receive_loop_.get();
    transport = transport_.get();
  }

  // joined without lifecycle_mutex_: callbacks on the loop threads may query
  // the engine. Only start()/stop() replace the loops, and both hold
  // transition_mutex_.
  if(announce) announce->stop();
  if(receive) receive->stop();
  if(transport) transport->close();
  logger_->info("Discovery stopped");
}

std::vector<Peer> DiscoveryEngine::list_peers() {
  double timeout = 0;
  {
    std::lock_guard lg(lifecycle_mutex_);
    timeout = config_.peer_timeout;
  }
  return peers_.list_active(PeerTable::Clock::now(), PeerTable::Timeout(timeout));
}

DiscoveryEngine::SendResult DiscoveryEngine::send_message(const std::string& recipient,
                                                          const std::string& title,
                                                          const std::string& content,
                                                          std::optional<std::string> conversation_id,
                                                          std::optional<std::string> reply_to) {
  SendResult result;

  // only peers that are still live count as known
  std::optional<Peer> peer;
  for(auto& active : list_peers()) {
    if(active.username == recipient) {
      peer = std::move(active);
      break;
    }
  }
  if(!peer) {
    result.status = SendResult::Status::PeerUnknown;
    result.error = "unknown peer '" + recipient + "'";
    logger_->debug("Not sending to {}: peer unknown", recipient);
    return result;
  }

  Message message;
  message.id = generate_message_id();
  message.sender = username_;
  message.recipient = recipient;
  message.title = title;
  message.content = content;
  message.timestamp = timestamp_now();
  message.conversation_id = conversation_id && !conversation_id->empty()
    ? std::move(conversation_id)
    : std::optional<std::string>(PeerTable::conversation_id(username_, recipient));
  message.reply_to = std::move(reply_to);

  auto payload = encode_packet(Packet::direct_message(message));
  {
    std::lock_guard lg(lifecycle_mutex_);
    if(!transport_) {
      result.status = SendResult::Status::TransportFailed;
      result.error = "engine has not been started";
      return result;
    }
    try {
      transport_->send_to(peer->address, payload);
    } catch(const TransportError& e) {
      result.status = SendResult::Status::TransportFailed;
      result.error = e.what();
    }
  }
  if(result.status == SendResult::Status::TransportFailed) {
    logger_->warn("Error sending message to {} at {}: {}", recipient, peer->address, result.error);
    return result;
  }

  store_.record(message);
  logger_->info("Sent message to {} at {}: {}", recipient, peer->address, title);
  result.status = SendResult::Status::Sent;
  result.message = std::move(message);
  return result;
}

std::vector<Message> DiscoveryEngine::list_messages(const std::optional<std::string>& peer) const {
  if(peer && !peer->empty()) {
    return store_.for_peer(*peer);
  }
  return store_.all();
}

std::vector<Message> DiscoveryEngine::get_conversation(const std::string& conversation_id) const {
  return store_.for_conversation(conversation_id);
}

void DiscoveryEngine::set_message_callback(MessageCallback callback) {
  std::lock_guard lg(callback_mutex_);
  message_callback_ = std::move(callback);
}

void DiscoveryEngine::set_debug_sink(DebugSink sink) {
  std::lock_guard lg(callback_mutex_);
  debug_sink_ = std::move(sink);
}

void DiscoveryEngine::dispatch_message(const Message& message) {
  MessageCallback callback;
  {
    std::lock_guard lg(callback_mutex_);
    callback = message_callback_;
  }
  if(callback) callback(message);
}

void DiscoveryEngine::dispatch_debug_line(const std::string& line) {
  DebugSink sink;
  {
    std::lock_guard lg(callback_mutex_);
    sink = debug_sink_;
  }
  if(sink) sink(line);
}

void DiscoveryEngine::set_debug_logging(bool enabled) {
  debug_enabled_ = enabled;
}

LogListenerHandle DiscoveryEngine::add_log_listener(Logger::Listener listener) {
  return logger_->add_listener(std::move(listener));
}

void DiscoveryEngine::remove_log_listener(LogListenerHandle handle) {
  if(handle != 0) {
    logger_->remove_listener(handle);
  }
}

uint16_t DiscoveryEngine::port() const {
  std::lock_guard lg(lifecycle_mutex_);
  return transport_ ? transport_->port() : config_.port;
}

DiscoveryEngine::Stats DiscoveryEngine::stats() const {
  Stats s;
  s.known_peers = peers_.size();
  s.stored_messages = store_.size();
  std::lock_guard lg(lifecycle_mutex_);
  if(announce_loop_) s.announcements_sent = announce_loop_->sent_count();
  if(receive_loop_) {
    s.datagrams_received = receive_loop_->received_count();
    s.malformed_datagrams = receive_loop_->malformed_count();
  }
  return s;
}
