#pragma once
#include <asio.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

#include "log.hpp"

// The single UDP socket shared by broadcast, unicast and receive.
//
// One thread may sit in receive() while others send; close() from any
// thread unblocks that receive with TransportClosedError. Sends run
// synchronously on the caller's thread beside the pending receive, which
// relies on the POSIX reactor (see send_payload). A Transport is
// opened once and closed once; open a fresh instance to start again.
class Transport {
public:
  struct Datagram {
    std::string payload;
    std::string source_address;
    uint16_t source_port = 0;
  };

  static constexpr std::size_t kMaxDatagramSize = 4096;
  static constexpr const char* kDefaultBroadcastAddress = "255.255.255.255";

  // port 0 binds an ephemeral port; port() then reports the real one and
  // all sends target it.
  Transport(uint16_t port,
            std::string broadcast_address = kDefaultBroadcastAddress,
            std::shared_ptr<Logger> logger = nullptr);
  ~Transport();

  Transport(const Transport&) = delete;
  Transport& operator=(const Transport&) = delete;

  // Throws TransportError.
  void open();

  // Best effort, no retry. Throws TransportError on failure.
  void broadcast(const std::string& payload);
  void send_to(const std::string& address, const std::string& payload);

  // Blocks until a datagram arrives. Throws TransportClosedError once the
  // transport is closed, TransportError for other socket errors.
  Datagram receive();

  void close();

  bool is_open() const;
  uint16_t port() const;

private:
  using udp = asio::ip::udp;

  void send_payload(const udp::endpoint& target, const std::string& payload);
  std::error_code close_socket_locked();
  void report_close_error(const std::error_code& ec);

  asio::io_context io_;
  udp::socket socket_;
  uint16_t requested_port_ = 0;
  uint16_t bound_port_ = 0;
  std::string broadcast_address_;
  udp::endpoint broadcast_endpoint_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  bool open_ = false;
  bool closed_ = false;
  bool receiving_ = false;
};

// Address of the interface that routes off-host, "127.0.0.1" when none
// does. Sends nothing.
std::string local_ip_address();
