#include "receive_loop.hpp"
#include "conversation_store.hpp"
#include "errors.hpp"
#include "peer_table.hpp"

#include <exception>

ReceiveLoop::ReceiveLoop(Transport& transport,
                         PeerTable& peers,
                         ConversationStore& store,
                         Options options,
                         std::shared_ptr<Logger> logger,
                         MessageCallback on_message)
  : transport_(transport),
    peers_(peers),
    store_(store),
    options_(std::move(options)),
    logger_(std::move(logger)),
    on_message_(std::move(on_message)) {}

ReceiveLoop::~ReceiveLoop() {
  stop();
}

void ReceiveLoop::start() {
  if(running_ || stop_requested_) return;
  running_ = true;
  thread_ = std::thread([this](){ run(); });
}

void ReceiveLoop::stop() {
  stop_requested_ = true;
  transport_.close();
  if(thread_.joinable()) {
    thread_.join();
  }
  running_ = false;
}

void ReceiveLoop::run() {
  log_debug(logger_.get(), "Started listening for packets on port {}", transport_.port());
  while(!stop_requested_) {
    Transport::Datagram datagram;
    try {
      datagram = transport_.receive();
    } catch(const TransportClosedError&) {
      break;
    } catch(const TransportError& e) {
      if(stop_requested_) break;
      log_warn(logger_.get(), "Packet receiving error: {}", e.what());
      continue;
    }
    handle_datagram(datagram);
  }
  log_debug(logger_.get(), "Receive loop stopped");
}

ReceiveLoop::Dispatch ReceiveLoop::handle_datagram(const Transport::Datagram& datagram) {
  ++received_;
  log_debug(logger_.get(), "Received {} bytes from {}:{}",
            datagram.payload.size(), datagram.source_address, datagram.source_port);

  Packet packet;
  try {
    packet = decode_packet(datagram.payload);
  } catch(const MalformedPacketError& e) {
    ++malformed_;
    log_warn(logger_.get(), "Dropping datagram from {}: {}", datagram.source_address, e.what());
    return Dispatch::Malformed;
  }

  log_debug(logger_.get(), "Decoded packet type: {}", packet_type_name(packet.type));
  if(packet.type == Packet::Type::Announcement) {
    return handle_announcement(packet, datagram.source_address);
  }
  return handle_message(std::move(packet));
}

ReceiveLoop::Dispatch ReceiveLoop::handle_announcement(const Packet& packet,
                                                      const std::string& source_address) {
  if(packet.username == options_.username) {
    return Dispatch::SelfAnnouncement;
  }
  peers_.upsert(packet.username, source_address, PeerTable::Clock::now());
  return Dispatch::PeerUpdated;
}

ReceiveLoop::Dispatch ReceiveLoop::handle_message(Packet packet) {
  Message& message = packet.message;
  if(message.recipient != options_.username) {
    log_debug(logger_.get(), "Ignoring message {} addressed to {}", message.id, message.recipient);
    return Dispatch::MessageDropped;
  }

  if(options_.stamp_receipt_time) {
    message.timestamp = timestamp_now();
  }
  store_.record(message);
  log_info(logger_.get(), "Received message from {}: {}", message.sender, message.title);

  if(on_message_) {
    try {
      on_message_(message);
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "Message callback threw: {}", e.what());
    }
  }
  return Dispatch::MessageRecorded;
}
