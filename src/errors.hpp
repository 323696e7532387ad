#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

// A datagram that could not be decoded into a known packet.
class MalformedPacketError : public std::runtime_error {
public:
  explicit MalformedPacketError(const std::string& what)
    : std::runtime_error("malformed packet: " + what) {}
};

// Socket setup or send failure.
class TransportError : public std::system_error {
public:
  TransportError(std::error_code ec, const std::string& what)
    : std::system_error(ec, what) {}
};

// Raised by Transport::receive() once the transport has been closed.
class TransportClosedError : public std::runtime_error {
public:
  TransportClosedError()
    : std::runtime_error("transport closed") {}
};
