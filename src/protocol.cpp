#include "protocol.hpp"
#include "errors.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace {

std::string require_string(const json& j, const char* key, const char* context) {
  auto it = j.find(key);
  if(it == j.end()) {
    throw MalformedPacketError(std::string(context) + " is missing '" + key + "'");
  }
  if(!it->is_string()) {
    throw MalformedPacketError(std::string(context) + " field '" + key + "' is not a string");
  }
  return it->get<std::string>();
}

std::optional<std::string> optional_string(const json& j, const char* key, const char* context) {
  auto it = j.find(key);
  if(it == j.end() || it->is_null()) return std::nullopt;
  if(!it->is_string()) {
    throw MalformedPacketError(std::string(context) + " field '" + key + "' is not a string");
  }
  return it->get<std::string>();
}

Timestamp require_timestamp(const json& j, const char* key, const char* context) {
  auto text = require_string(j, key, context);
  auto parsed = parse_timestamp(text);
  if(!parsed) {
    throw MalformedPacketError(std::string(context) + " has invalid timestamp '" + text + "'");
  }
  return *parsed;
}

bool read_digits(const std::string& text, std::size_t& pos, std::size_t count, int& out) {
  if(pos + count > text.size()) return false;
  int value = 0;
  for(std::size_t i = 0; i < count; ++i) {
    unsigned char ch = static_cast<unsigned char>(text[pos + i]);
    if(!std::isdigit(ch)) return false;
    value = value * 10 + (ch - '0');
  }
  pos += count;
  out = value;
  return true;
}

} // namespace

Timestamp timestamp_now() {
  return std::chrono::floor<std::chrono::microseconds>(std::chrono::system_clock::now());
}

std::string format_timestamp(Timestamp ts) {
  auto secs = std::chrono::floor<std::chrono::seconds>(ts);
  auto micros = (ts - secs).count();
  std::time_t t = std::chrono::system_clock::to_time_t(secs);
  std::tm tm{};
  localtime_r(&t, &tm);
  // the offset keeps the repeated hour at a DST fall-back unambiguous
  long offset_minutes = tm.tm_gmtoff / 60;
  char sign = offset_minutes < 0 ? '-' : '+';
  if(offset_minutes < 0) offset_minutes = -offset_minutes;
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
      << '.' << std::setw(6) << std::setfill('0') << micros
      << sign << std::setw(2) << offset_minutes / 60
      << ':' << std::setw(2) << offset_minutes % 60;
  return oss.str();
}

std::optional<Timestamp> parse_timestamp(const std::string& text) {
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if(iss.fail()) return std::nullopt;

  std::size_t pos = text.size();
  if(!iss.eof()) {
    auto at = iss.tellg();
    if(at < 0) return std::nullopt;
    pos = static_cast<std::size_t>(at);
  }

  long micros = 0;
  if(pos < text.size() && text[pos] == '.') {
    ++pos;
    std::size_t digits = 0;
    while(pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if(digits < 6) micros = micros * 10 + (text[pos] - '0');
      ++digits;
      ++pos;
    }
    if(digits == 0 || digits > 9) return std::nullopt;
    for(std::size_t i = digits; i < 6; ++i) micros *= 10;
  }

  bool has_offset = false;
  long offset_seconds = 0;
  if(pos < text.size()) {
    char marker = text[pos];
    if(marker == 'Z' || marker == 'z') {
      has_offset = true;
      ++pos;
    } else if(marker == '+' || marker == '-') {
      ++pos;
      int hours = 0;
      int minutes = 0;
      if(!read_digits(text, pos, 2, hours)) return std::nullopt;
      if(pos < text.size() && text[pos] == ':') ++pos;
      if(!read_digits(text, pos, 2, minutes)) return std::nullopt;
      if(hours > 23 || minutes > 59) return std::nullopt;
      offset_seconds = (hours * 3600L + minutes * 60L) * (marker == '-' ? -1 : 1);
      has_offset = true;
    }
  }
  if(pos != text.size()) return std::nullopt;

  std::time_t seconds = 0;
  if(has_offset) {
    seconds = timegm(&tm) - offset_seconds;
  } else {
    tm.tm_isdst = -1;
    seconds = std::mktime(&tm);
    if(seconds == static_cast<std::time_t>(-1)) return std::nullopt;
  }
  return Timestamp(std::chrono::seconds(seconds) + std::chrono::microseconds(micros));
}

bool operator==(const Message& a, const Message& b) {
  return a.id == b.id &&
         a.sender == b.sender &&
         a.recipient == b.recipient &&
         a.title == b.title &&
         a.content == b.content &&
         a.timestamp == b.timestamp &&
         a.conversation_id == b.conversation_id &&
         a.reply_to == b.reply_to;
}

bool operator!=(const Message& a, const Message& b) {
  return !(a == b);
}

Packet Packet::announcement(std::string username, Timestamp timestamp) {
  Packet p;
  p.type = Type::Announcement;
  p.username = std::move(username);
  p.timestamp = timestamp;
  return p;
}

Packet Packet::direct_message(Message message) {
  Packet p;
  p.type = Type::Message;
  p.message = std::move(message);
  return p;
}

bool operator==(const Packet& a, const Packet& b) {
  if(a.type != b.type) return false;
  if(a.type == Packet::Type::Announcement) {
    return a.username == b.username && a.timestamp == b.timestamp;
  }
  return a.message == b.message;
}

bool operator!=(const Packet& a, const Packet& b) {
  return !(a == b);
}

const char* packet_type_name(Packet::Type type) {
  return type == Packet::Type::Announcement ? kAnnouncementType : kMessageType;
}

std::string generate_message_id() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  uint64_t hi = dist(rng);
  uint64_t lo = dist(rng);
  // version 4, RFC 4122 variant
  hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;
  std::ostringstream oss;
  oss << std::nouppercase << std::hex << std::setfill('0')
      << std::setw(8) << (hi >> 32) << '-'
      << std::setw(4) << ((hi >> 16) & 0xffff) << '-'
      << std::setw(4) << (hi & 0xffff) << '-'
      << std::setw(4) << (lo >> 48) << '-'
      << std::setw(12) << (lo & 0xffffffffffffULL);
  return oss.str();
}

json make_announcement(const std::string& username, Timestamp timestamp) {
  json j;
  j["type"] = kAnnouncementType;
  j["username"] = username;
  j["timestamp"] = format_timestamp(timestamp);
  return j;
}

json message_to_json(const Message& message) {
  json j;
  j["id"] = message.id;
  j["sender"] = message.sender;
  j["recipient"] = message.recipient;
  j["title"] = message.title;
  j["content"] = message.content;
  j["timestamp"] = format_timestamp(message.timestamp);
  j["conversation_id"] = message.conversation_id ? json(*message.conversation_id) : json(nullptr);
  j["reply_to"] = message.reply_to ? json(*message.reply_to) : json(nullptr);
  return j;
}

Message message_from_json(const json& j) {
  if(!j.is_object()) {
    throw MalformedPacketError("message data is not an object");
  }
  Message m;
  m.id = require_string(j, "id", "message");
  m.sender = require_string(j, "sender", "message");
  m.recipient = require_string(j, "recipient", "message");
  m.title = require_string(j, "title", "message");
  m.content = require_string(j, "content", "message");
  m.timestamp = require_timestamp(j, "timestamp", "message");
  m.conversation_id = optional_string(j, "conversation_id", "message");
  m.reply_to = optional_string(j, "reply_to", "message");
  return m;
}

json make_message_packet(const Message& message) {
  json j;
  j["type"] = kMessageType;
  j["data"] = message_to_json(message);
  return j;
}

std::string encode_packet(const Packet& packet) {
  json j = packet.type == Packet::Type::Announcement
    ? make_announcement(packet.username, packet.timestamp)
    : make_message_packet(packet.message);
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

Packet decode_packet(const std::string& payload) {
  json j;
  try {
    j = json::parse(payload);
  } catch(const json::exception& e) {
    throw MalformedPacketError(e.what());
  }
  if(!j.is_object()) {
    throw MalformedPacketError("packet is not an object");
  }

  const std::string type = require_string(j, "type", "packet");
  if(type == kAnnouncementType) {
    return Packet::announcement(require_string(j, "username", "announcement"),
                                require_timestamp(j, "timestamp", "announcement"));
  }
  if(type == kMessageType) {
    auto it = j.find("data");
    if(it == j.end()) {
      throw MalformedPacketError("message packet is missing 'data'");
    }
    return Packet::direct_message(message_from_json(*it));
  }
  throw MalformedPacketError("unknown packet type '" + type + "'");
}
