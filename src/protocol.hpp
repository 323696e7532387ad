#pragma once
#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

using json = nlohmann::json;

// protocol.hpp
inline constexpr const char* kAnnouncementType = "announcement";
inline constexpr const char* kMessageType = "message";

// Wall-clock time as carried on the wire (ISO-8601, microsecond resolution).
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

Timestamp timestamp_now();
std::string format_timestamp(Timestamp ts);
std::optional<Timestamp> parse_timestamp(const std::string& text);

struct Message {
  std::string id;
  std::string sender;
  std::string recipient;
  std::string title;
  std::string content;
  Timestamp timestamp{};
  std::optional<std::string> conversation_id;
  std::optional<std::string> reply_to;
};

bool operator==(const Message& a, const Message& b);
bool operator!=(const Message& a, const Message& b);

struct Packet {
  enum class Type { Announcement, Message } type = Type::Announcement;

  // announcement fields
  std::string username;
  Timestamp timestamp{};

  // message payload
  Message message;

  static Packet announcement(std::string username, Timestamp timestamp);
  static Packet direct_message(Message message);
};

bool operator==(const Packet& a, const Packet& b);
bool operator!=(const Packet& a, const Packet& b);

// Random UUIDv4 text, used as Message::id.
std::string generate_message_id();

json make_announcement(const std::string& username, Timestamp timestamp);
json make_message_packet(const Message& message);

json message_to_json(const Message& message);
// Throws MalformedPacketError.
Message message_from_json(const json& j);

std::string encode_packet(const Packet& packet);
// Throws MalformedPacketError when the payload is not a well-formed packet.
// Unknown extra fields are ignored.
Packet decode_packet(const std::string& payload);

const char* packet_type_name(Packet::Type type);
