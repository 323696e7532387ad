#include "transport.hpp"
#include "errors.hpp"

#include <array>

Transport::Transport(uint16_t port,
                     std::string broadcast_address,
                     std::shared_ptr<Logger> logger)
  : socket_(io_),
    requested_port_(port),
    broadcast_address_(std::move(broadcast_address)),
    logger_(std::move(logger)) {}

Transport::~Transport() {
  close();
}

void Transport::open() {
  std::unique_lock lg(m_);
  if(open_) return;
  if(closed_) {
    throw TransportError(asio::error::make_error_code(asio::error::bad_descriptor),
                         "transport already closed");
  }

  std::error_code ec;
  auto broadcast_ip = asio::ip::make_address_v4(broadcast_address_, ec);
  if(ec) {
    throw TransportError(ec, "invalid broadcast address '" + broadcast_address_ + "'");
  }

  udp::endpoint endpoint(udp::v4(), requested_port_);
  socket_.open(endpoint.protocol(), ec);
  if(ec) throw TransportError(ec, "open udp socket");

  socket_.set_option(asio::socket_base::reuse_address(true), ec);
  if(!ec) socket_.set_option(asio::socket_base::broadcast(true), ec);
  if(!ec) socket_.bind(endpoint, ec);
  if(ec) {
    std::error_code ignored;
    socket_.close(ignored);
    throw TransportError(ec, "bind udp port " + std::to_string(requested_port_));
  }

  bound_port_ = socket_.local_endpoint(ec).port();
  if(ec) {
    std::error_code ignored;
    socket_.close(ignored);
    throw TransportError(ec, "query bound port");
  }
  broadcast_endpoint_ = udp::endpoint(broadcast_ip, bound_port_);
  open_ = true;
  lg.unlock();
  log_debug(logger_.get(), "UDP socket bound to port {} (broadcast {})", bound_port_, broadcast_address_);
}

void Transport::broadcast(const std::string& payload) {
  send_payload(broadcast_endpoint_, payload);
}

void Transport::send_to(const std::string& address, const std::string& payload) {
  std::error_code ec;
  auto ip = asio::ip::make_address(address, ec);
  if(ec) {
    throw TransportError(ec, "invalid peer address '" + address + "'");
  }
  send_payload(udp::endpoint(ip, port()), payload);
}

void Transport::send_payload(const udp::endpoint& target, const std::string& payload) {
  std::lock_guard lg(m_);
  if(!open_ || closed_) {
    throw TransportError(asio::error::make_error_code(asio::error::bad_descriptor),
                         "transport is not open");
  }
  // Synchronous send while receive() may hold an async_receive_from on the
  // same socket from another thread. On the POSIX reactor a blocking send_to
  // is a plain sendto(2) plus poll(2) on EAGAIN and never touches the
  // reactor's per-descriptor queues, so only initiations need m_. Windows
  // IOCP is not supported by this arrangement.
  std::error_code ec;
  socket_.send_to(asio::buffer(payload), target, 0, ec);
  if(ec) {
    throw TransportError(ec, "send to " + target.address().to_string() + ":" + std::to_string(target.port()));
  }
}

Transport::Datagram Transport::receive() {
  std::array<char, kMaxDatagramSize> buffer;
  udp::endpoint sender;
  std::error_code result;
  std::size_t received = 0;

  {
    std::lock_guard lg(m_);
    if(!open_ || closed_) throw TransportClosedError();
    receiving_ = true;
    socket_.async_receive_from(asio::buffer(buffer), sender,
      [&](const std::error_code& ec, std::size_t n){
        result = ec;
        received = n;
      });
  }

  // Runs until the receive completes; a close() posted meanwhile runs here
  // too and aborts the pending operation.
  io_.restart();
  io_.run();

  {
    std::unique_lock lg(m_);
    receiving_ = false;
    if(closed_) {
      auto ec = close_socket_locked();
      lg.unlock();
      report_close_error(ec);
      throw TransportClosedError();
    }
  }

  if(result) {
    if(result == asio::error::operation_aborted || result == asio::error::bad_descriptor) {
      throw TransportClosedError();
    }
    throw TransportError(result, "receive");
  }

  Datagram d;
  d.payload.assign(buffer.data(), received);
  d.source_address = sender.address().to_string();
  d.source_port = sender.port();
  return d;
}

void Transport::close() {
  std::error_code ec;
  {
    std::lock_guard lg(m_);
    if(closed_) return;
    closed_ = true;
    if(receiving_) {
      asio::post(io_, [this](){
        std::error_code posted;
        {
          std::lock_guard inner(m_);
          posted = close_socket_locked();
        }
        report_close_error(posted);
      });
      return;
    }
    ec = close_socket_locked();
  }
  report_close_error(ec);
}

std::error_code Transport::close_socket_locked() {
  std::error_code ec;
  if(socket_.is_open()) socket_.close(ec);
  return ec;
}

void Transport::report_close_error(const std::error_code& ec) {
  if(ec) {
    log_warn(logger_.get(), "Closing UDP socket failed: {}", ec.message());
  }
}

bool Transport::is_open() const {
  std::lock_guard lg(m_);
  return open_ && !closed_;
}

uint16_t Transport::port() const {
  std::lock_guard lg(m_);
  return open_ ? bound_port_ : requested_port_;
}

std::string local_ip_address() {
  asio::io_context io;
  asio::ip::udp::socket socket(io);
  std::error_code ec;
  // connecting a datagram socket only selects a route
  socket.connect(asio::ip::udp::endpoint(asio::ip::make_address_v4("10.255.255.255"), 1), ec);
  if(ec) return "127.0.0.1";
  auto local = socket.local_endpoint(ec);
  if(ec) return "127.0.0.1";
  return local.address().to_string();
}
