#include "command_line_parser.hpp"
#include "conversation_store.hpp"
#include "debug_log.hpp"
#include "errors.hpp"
#include "lanshare_cli.hpp"
#include "peer_table.hpp"
#include "protocol.hpp"
#include "receive_loop.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <future>
#include <iostream>
#include <optional>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

using lanshare::test::TestCase;
using lanshare::test::TestContext;
using namespace std::chrono_literals;

Message sample_message(const std::string& sender, const std::string& recipient) {
  Message m;
  m.id = generate_message_id();
  m.sender = sender;
  m.recipient = recipient;
  m.title = "Hi";
  m.content = "hello";
  m.timestamp = timestamp_now();
  m.conversation_id = PeerTable::conversation_id(sender, recipient);
  return m;
}

bool throws_malformed(const std::string& payload) {
  try {
    decode_packet(payload);
  } catch(const MalformedPacketError&) {
    return true;
  }
  return false;
}

// codec

bool test_announcement_round_trip(TestContext&) {
  auto packet = Packet::announcement("alice", timestamp_now());
  auto decoded = decode_packet(encode_packet(packet));
  return decoded == packet && decoded.type == Packet::Type::Announcement;
}

bool test_message_round_trip(TestContext&) {
  auto message = sample_message("alice", "bob");
  message.reply_to = generate_message_id();
  auto packet = Packet::direct_message(message);
  auto decoded = decode_packet(encode_packet(packet));
  if(decoded != packet) return false;

  message.conversation_id.reset();
  message.reply_to.reset();
  auto bare = Packet::direct_message(message);
  return decode_packet(encode_packet(bare)) == bare;
}

bool test_wire_shape(TestContext&) {
  auto message = sample_message("alice", "bob");
  message.conversation_id.reset();
  auto j = json::parse(encode_packet(Packet::direct_message(message)));
  if(j.at("type") != "message") return false;
  const auto& data = j.at("data");
  if(!data.at("conversation_id").is_null() || !data.at("reply_to").is_null()) return false;
  if(data.at("id") != message.id) return false;

  auto a = json::parse(encode_packet(Packet::announcement("alice", timestamp_now())));
  return a.at("type") == "announcement" && a.at("username") == "alice" &&
         a.at("timestamp").is_string();
}

bool test_decode_rejects_malformed(TestContext&) {
  auto ts = format_timestamp(timestamp_now());
  return throws_malformed("not json at all") &&
         throws_malformed("[1,2,3]") &&
         throws_malformed("{\"username\":\"alice\",\"timestamp\":\"" + ts + "\"}") &&
         throws_malformed("{\"type\":\"ping\",\"username\":\"alice\"}") &&
         throws_malformed("{\"type\":\"announcement\",\"timestamp\":\"" + ts + "\"}") &&
         throws_malformed("{\"type\":\"announcement\",\"username\":7,\"timestamp\":\"" + ts + "\"}") &&
         throws_malformed("{\"type\":\"announcement\",\"username\":\"alice\",\"timestamp\":\"yesterday\"}") &&
         throws_malformed("{\"type\":\"message\"}") &&
         throws_malformed("{\"type\":\"message\",\"data\":{\"id\":\"x\"}}");
}

bool test_decode_ignores_unknown_fields(TestContext&) {
  auto j = make_announcement("alice", timestamp_now());
  j["version"] = 2;
  j["extra"] = {{"nested", true}};
  auto decoded = decode_packet(j.dump());
  return decoded.username == "alice";
}

bool test_timestamp_formats(TestContext&) {
  // no offset reads as local time; formatting adds the local offset back
  const std::string text = "2024-05-01T13:45:10.123456";
  auto parsed = parse_timestamp(text);
  if(!parsed) return false;
  auto formatted = format_timestamp(*parsed);
  if(formatted.compare(0, text.size(), text) != 0 || parse_timestamp(formatted) != parsed) return false;

  auto utc = parse_timestamp("2024-05-01T12:00:00Z");
  auto offset = parse_timestamp("2024-05-01T14:00:00+02:00");
  if(!utc || !offset || *utc != *offset) return false;

  auto nanos = parse_timestamp("2024-05-01T12:00:00.123456789Z");
  if(!nanos || (*nanos - *utc) != std::chrono::microseconds(123456)) return false;

  auto short_fraction = parse_timestamp("2024-05-01T12:00:00.5Z");
  if(!short_fraction || (*short_fraction - *utc) != std::chrono::microseconds(500000)) return false;

  return !parse_timestamp("2024-05-01") &&
         !parse_timestamp("2024-05-01T12:00:00.") &&
         !parse_timestamp("2024-05-01T12:00:00+2") &&
         !parse_timestamp("2024-05-01T12:00:00 trailing");
}

// Sets TZ for one test and restores the previous zone afterwards.
class ScopedTimeZone {
public:
  explicit ScopedTimeZone(const char* zone) {
    if(const char* current = std::getenv("TZ")) previous_ = current;
    setenv("TZ", zone, 1);
    tzset();
  }

  ~ScopedTimeZone() {
    if(previous_) {
      setenv("TZ", previous_->c_str(), 1);
    } else {
      unsetenv("TZ");
    }
    tzset();
  }

private:
  std::optional<std::string> previous_;
};

bool test_timestamp_survives_dst_fall_back(TestContext&) {
  // POSIX rule string, so no tz database is needed
  ScopedTimeZone zone("EST5EDT,M3.2.0,M11.1.0");
  // 01:30 local happens twice on 2024-11-03: at 05:30Z (EDT) and 06:30Z (EST)
  auto first = parse_timestamp("2024-11-03T05:30:00Z");
  auto second = parse_timestamp("2024-11-03T06:30:00Z");
  if(!first || !second) return false;

  auto first_text = format_timestamp(*first);
  auto second_text = format_timestamp(*second);
  if(first_text != "2024-11-03T01:30:00.000000-04:00" ||
     second_text != "2024-11-03T01:30:00.000000-05:00") {
    return false;
  }

  auto packet = Packet::announcement("alice", *second);
  return decode_packet(encode_packet(packet)) == packet &&
         parse_timestamp(first_text) == first;
}

bool test_message_ids_are_uuid_v4(TestContext&) {
  std::set<std::string> seen;
  for(int i = 0; i < 200; ++i) {
    auto id = generate_message_id();
    if(id.size() != 36 || id[8] != '-' || id[13] != '-' || id[14] != '4' ||
       id[18] != '-' || id[23] != '-') {
      return false;
    }
    seen.insert(id);
  }
  return seen.size() == 200;
}

// peer table

bool test_peer_expires_after_timeout(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("peers");
  ctx.logs.attach(logger);
  PeerTable table(logger);
  auto t0 = PeerTable::Clock::now();
  const PeerTable::Timeout timeout(2.0);

  if(!table.upsert("alice", "10.0.0.5", t0)) return false;
  auto at_one = table.list_active(t0 + 1s, timeout);
  if(at_one.size() != 1 || at_one[0].username != "alice" || at_one[0].address != "10.0.0.5") {
    return false;
  }
  if(!table.list_active(t0 + 3s, timeout).empty()) return false;
  return !table.find("alice") && table.size() == 0 &&
         ctx.logs.contains("Removing alice - not seen for 3.0 seconds");
}

bool test_reannounce_keeps_peer_alive(TestContext&) {
  PeerTable table;
  auto t0 = PeerTable::Clock::now();
  const PeerTable::Timeout timeout(2.0);
  table.upsert("alice", "10.0.0.5", t0);
  if(table.upsert("alice", "10.0.0.5", t0 + 1500ms)) return false;
  auto active = table.list_active(t0 + 3s, timeout);
  return active.size() == 1 && active[0].first_seen == t0 && active[0].last_seen == t0 + 1500ms;
}

bool test_first_seen_never_after_last_seen(TestContext&) {
  PeerTable table;
  auto t0 = PeerTable::Clock::now();
  table.upsert("alice", "10.0.0.5", t0);
  table.upsert("alice", "10.0.0.5", t0 - 5s);
  auto peer = table.find("alice");
  return peer && peer->first_seen <= peer->last_seen && peer->first_seen == t0;
}

bool test_peer_address_follows_latest_announcement(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("peers");
  ctx.logs.attach(logger);
  PeerTable table(logger);
  auto t0 = PeerTable::Clock::now();
  table.upsert("alice", "10.0.0.5", t0);
  table.upsert("alice", "10.0.0.9", t0 + 100ms);
  auto peer = table.find("alice");
  return peer && peer->address == "10.0.0.9" && ctx.logs.contains("10.0.0.5 -> 10.0.0.9");
}

bool test_active_peers_sorted(TestContext&) {
  PeerTable table;
  auto t0 = PeerTable::Clock::now();
  table.upsert("carol", "10.0.0.3", t0);
  table.upsert("alice", "10.0.0.1", t0);
  table.upsert("bob", "10.0.0.2", t0);
  auto active = table.list_active(t0, PeerTable::Timeout(2.0));
  return active.size() == 3 && active[0].username == "alice" &&
         active[1].username == "bob" && active[2].username == "carol";
}

bool test_log_listener_may_read_peer_table(TestContext&) {
  auto logger = std::make_shared<Logger>("peers");
  PeerTable table(logger);
  std::atomic<std::size_t> observed{0};
  logger->add_listener([&](const std::string&, spdlog::level::level_enum, const std::string&){
    observed += table.size();
    table.find("alice");
    return true;
  });

  auto t0 = PeerTable::Clock::now();
  auto done = std::async(std::launch::async, [&]{
    table.upsert("alice", "10.0.0.5", t0);
    table.upsert("alice", "10.0.0.6", t0 + 100ms);
    table.list_active(t0 + 10s, PeerTable::Timeout(1.0));
  });
  if(done.wait_for(2s) != std::future_status::ready) {
    std::cerr << "peer table held its lock while logging\n";
    std::_Exit(1);
  }
  done.get();
  return observed > 0 && table.size() == 0;
}

bool test_tables_under_concurrent_access(TestContext&) {
  PeerTable table;
  ConversationStore store;
  constexpr int kRounds = 2000;
  constexpr int kPeers = 8;
  std::atomic<bool> inconsistent{false};
  std::atomic<bool> writers_done{false};

  std::thread announcer([&]{
    for(int i = 0; i < kRounds; ++i) {
      table.upsert("peer" + std::to_string(i % kPeers), "10.0.0." + std::to_string(i % kPeers),
                   PeerTable::Clock::now());
    }
  });
  // a tiny timeout makes eviction race with the upserts above
  std::thread evictor([&]{
    while(!writers_done) {
      for(const auto& peer : table.list_active(PeerTable::Clock::now(), PeerTable::Timeout(0.0001))) {
        if(peer.first_seen > peer.last_seen || peer.username.empty() ||
           peer.address != "10.0.0." + peer.username.substr(4)) {
          inconsistent = true;
        }
      }
    }
  });
  std::thread recorder([&]{
    for(int i = 0; i < kRounds; ++i) {
      store.record(sample_message(i % 2 ? "alice" : "bob", i % 2 ? "bob" : "alice"));
    }
  });
  std::thread reader([&]{
    while(!writers_done) {
      auto messages = store.for_peer("alice");
      for(const auto& m : messages) {
        if(m.id.empty() || (m.sender != "alice" && m.recipient != "alice")) inconsistent = true;
      }
      if(messages.size() > static_cast<std::size_t>(kRounds)) inconsistent = true;
    }
  });

  announcer.join();
  recorder.join();
  writers_done = true;
  evictor.join();
  reader.join();

  auto t0 = PeerTable::Clock::now();
  for(int i = 0; i < kPeers; ++i) {
    table.upsert("peer" + std::to_string(i), "10.0.0." + std::to_string(i), t0);
  }
  auto active = table.list_active(t0, PeerTable::Timeout(60.0));
  std::set<std::string> names;
  for(const auto& peer : active) {
    names.insert(peer.username);
    if(peer.first_seen > peer.last_seen) inconsistent = true;
  }
  return !inconsistent && active.size() == kPeers && names.size() == kPeers &&
         store.size() == static_cast<std::size_t>(kRounds) &&
         store.for_peer("alice").size() == static_cast<std::size_t>(kRounds);
}

bool test_conversation_id(TestContext&) {
  auto ab = PeerTable::conversation_id("alice", "bob");
  auto ba = PeerTable::conversation_id("bob", "alice");
  auto ac = PeerTable::conversation_id("alice", "carol");
  return ab == ba && ab != ac && ab.size() == PeerTable::kConversationIdLength &&
         ab.find_first_not_of("0123456789abcdef") == std::string::npos;
}

// conversation store

bool test_store_queries(TestContext&) {
  ConversationStore store;
  auto m1 = sample_message("alice", "bob");
  auto m2 = sample_message("bob", "alice");
  auto m3 = sample_message("alice", "carol");
  store.record(m1);
  store.record(m2);
  store.record(m3);

  auto all = store.all();
  if(all.size() != 3 || all[0] != m1 || all[2] != m3) return false;

  auto with_bob = store.for_peer("bob");
  if(with_bob.size() != 2 || with_bob[0] != m1 || with_bob[1] != m2) return false;

  auto conv = store.for_conversation(PeerTable::conversation_id("bob", "alice"));
  if(conv.size() != 2) return false;
  return store.for_peer("dave").empty() && store.for_conversation("none").empty();
}

bool test_store_keeps_duplicates(TestContext&) {
  ConversationStore store;
  auto m = sample_message("alice", "bob");
  store.record(m);
  store.record(m);
  return store.size() == 2;
}

// receive dispatch

struct DispatchFixture {
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("me");
  Transport transport{0, "127.0.0.1", logger};
  PeerTable peers{logger};
  ConversationStore store;
  std::vector<Message> delivered;

  std::unique_ptr<ReceiveLoop> make_loop(bool stamp_receipt_time = true) {
    ReceiveLoop::Options options;
    options.username = "me";
    options.stamp_receipt_time = stamp_receipt_time;
    return std::make_unique<ReceiveLoop>(transport, peers, store, options, logger,
                                         [this](const Message& m){ delivered.push_back(m); });
  }

  static Transport::Datagram datagram(const std::string& payload, const std::string& from) {
    Transport::Datagram d;
    d.payload = payload;
    d.source_address = from;
    d.source_port = 12345;
    return d;
  }
};

bool test_dispatch_announcements(TestContext&) {
  DispatchFixture f;
  auto loop = f.make_loop();
  auto from_alice = encode_packet(Packet::announcement("alice", timestamp_now()));
  auto from_me = encode_packet(Packet::announcement("me", timestamp_now()));
  if(loop->handle_datagram(f.datagram(from_alice, "10.0.0.5")) != ReceiveLoop::Dispatch::PeerUpdated) return false;
  if(loop->handle_datagram(f.datagram(from_me, "10.0.0.1")) != ReceiveLoop::Dispatch::SelfAnnouncement) return false;
  auto alice = f.peers.find("alice");
  return alice && alice->address == "10.0.0.5" && !f.peers.find("me") && f.peers.size() == 1;
}

bool test_dispatch_messages(TestContext&) {
  DispatchFixture f;
  auto loop = f.make_loop();

  auto to_me = sample_message("alice", "me");
  to_me.timestamp = *parse_timestamp("2001-01-01T00:00:00Z");
  auto to_other = sample_message("alice", "bob");

  if(loop->handle_datagram(f.datagram(encode_packet(Packet::direct_message(to_me)), "10.0.0.5")) !=
     ReceiveLoop::Dispatch::MessageRecorded) return false;
  if(loop->handle_datagram(f.datagram(encode_packet(Packet::direct_message(to_other)), "10.0.0.5")) !=
     ReceiveLoop::Dispatch::MessageDropped) return false;

  auto stored = f.store.all();
  if(stored.size() != 1 || stored[0].id != to_me.id) return false;
  // receipt time replaces the sender's clock
  if(stored[0].timestamp == to_me.timestamp) return false;
  return f.delivered.size() == 1 && f.delivered[0].id == to_me.id;
}

bool test_dispatch_keeps_sender_time(TestContext&) {
  DispatchFixture f;
  auto loop = f.make_loop(false);
  auto to_me = sample_message("alice", "me");
  to_me.timestamp = *parse_timestamp("2001-01-01T00:00:00Z");
  loop->handle_datagram(f.datagram(encode_packet(Packet::direct_message(to_me)), "10.0.0.5"));
  auto stored = f.store.all();
  return stored.size() == 1 && stored[0] == to_me;
}

bool test_dispatch_malformed(TestContext& ctx) {
  DispatchFixture f;
  ctx.logs.attach(f.logger);
  auto loop = f.make_loop();
  if(loop->handle_datagram(f.datagram("{\"type\":", "10.0.0.7")) != ReceiveLoop::Dispatch::Malformed) return false;
  if(loop->handle_datagram(f.datagram("\xff\xfe", "10.0.0.7")) != ReceiveLoop::Dispatch::Malformed) return false;
  return loop->malformed_count() == 2 && loop->received_count() == 2 &&
         f.peers.size() == 0 && f.store.size() == 0 &&
         ctx.logs.contains("Dropping datagram from 10.0.0.7");
}

// settings

bool test_settings_defaults_and_aliases(TestContext&) {
  SettingsManager settings;
  if(settings.get<int>("port") != 12345) return false;
  if(settings.get<double>("peer_timeout") != 2.0) return false;
  if(settings.get<double>("broadcast_interval") != 0.1) return false;
  if(settings.get<std::string>("broadcast_address") != "255.255.255.255") return false;
  if(!settings.get<bool>("stamp_receipt_time") || settings.get<bool>("debug")) return false;
  if(settings.get<int>("max_debug_messages") != 100) return false;

  return settings.resolve_key("pt") == std::optional<std::string>("peer_timeout") &&
         settings.resolve_key("USER") == std::optional<std::string>("username") &&
         settings.resolve_key("?") == std::optional<std::string>("help") &&
         !settings.resolve_key("listen_port");
}

bool test_settings_type_checks(TestContext&) {
  SettingsManager settings;
  std::string error;
  if(settings.set_from_string("port", "12x", error) || error.empty()) return false;
  if(settings.set_from_string("debug", "maybe", error)) return false;
  if(settings.set_from_json("peer_timeout", "fast", error)) return false;
  if(!settings.set_from_string("interval", "0.25", error)) return false;
  if(!settings.set_from_string("d", "on", error)) return false;
  return settings.get<double>("broadcast_interval") == 0.25 && settings.get<bool>("debug") &&
         settings.get<int>("port") == 12345;
}

bool test_settings_persist(TestContext&) {
  auto dir = lanshare::test::scratch_directory("settings");
  auto path = dir / "lanshare.conf";

  SettingsManager settings;
  settings.set_settings_path(path);
  lanshare::test::configure(settings, "username", "alice");
  lanshare::test::configure(settings, "port", 23456);
  lanshare::test::configure(settings, "debug", true);
  lanshare::test::configure(settings, "help", true);
  if(!settings.save()) return false;

  auto saved = settings.get_json(true);
  if(saved.contains("help") || saved.contains("save")) return false;

  SettingsManager reloaded;
  reloaded.set_settings_path(path);
  if(!reloaded.load()) return false;
  bool ok = reloaded.get<std::string>("username") == "alice" &&
            reloaded.get<int>("port") == 23456 &&
            reloaded.get<bool>("debug") &&
            !reloaded.help_requested();

  SettingsManager missing;
  missing.set_settings_path(dir / "absent.conf");
  ok = ok && !missing.load() && missing.get<int>("port") == 12345;

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return ok;
}

// command line

bool parse_args(std::vector<std::string> args, SettingsManager& settings, std::string& error) {
  args.insert(args.begin(), "lanshare");
  std::vector<char*> argv;
  for(auto& arg : args) argv.push_back(arg.data());
  CommandLineParser parser;
  return parser.parse(static_cast<int>(argv.size()), argv.data(), settings, error);
}

bool test_command_line_positional(TestContext&) {
  SettingsManager settings;
  std::string error;
  if(!parse_args({"alice", "23456"}, settings, error)) return false;
  return settings.get<std::string>("username") == "alice" && settings.get<int>("port") == 23456;
}

bool test_command_line_options(TestContext&) {
  SettingsManager settings;
  std::string error;
  if(!parse_args({"--username=bob", "-p", "4000", "--debug", "--timeout", "3.5", "--srt", "false"},
                 settings, error)) {
    return false;
  }
  return settings.get<std::string>("username") == "bob" &&
         settings.get<int>("port") == 4000 &&
         settings.get<bool>("debug") &&
         settings.get<double>("peer_timeout") == 3.5 &&
         !settings.get<bool>("stamp_receipt_time");
}

bool test_command_line_errors(TestContext&) {
  SettingsManager settings;
  std::string error;
  if(parse_args({"--bogus"}, settings, error) || error.find("--bogus") == std::string::npos) return false;
  error.clear();
  if(parse_args({"--port"}, settings, error) || error.empty()) return false;
  error.clear();
  if(parse_args({"alice", "notaport"}, settings, error) || error.empty()) return false;
  error.clear();
  return !parse_args({"alice", "1", "extra"}, settings, error) && !error.empty();
}

// debug log

bool test_debug_log_capacity(TestContext&) {
  DebugLog log(3);
  for(int i = 0; i < 5; ++i) {
    log.append("line " + std::to_string(i));
  }
  auto entries = log.entries();
  if(entries.size() != 3 || entries.front().message != "line 2" || entries.back().message != "line 4") {
    return false;
  }
  if(entries.front().time.size() != 8 || entries.front().time[2] != ':') return false;

  log.set_capacity(1);
  if(log.size() != 1 || log.entries().front().message != "line 4") return false;
  log.clear();
  return log.size() == 0 && log.capacity() == 1;
}

// shell

bool test_message_command_parsing(TestContext&) {
  auto full = LanShareCLI::parse_message_command("bob#1a2b Lunch plans | noon at the usual place");
  if(!full || full->recipient != "bob#1a2b" || full->title != "Lunch plans" ||
     full->content != "noon at the usual place") {
    return false;
  }
  return !LanShareCLI::parse_message_command("") &&
         !LanShareCLI::parse_message_command("bob no separator") &&
         !LanShareCLI::parse_message_command("bob | missing title") &&
         !LanShareCLI::parse_message_command("bob title |   ");
}

bool test_age_formatting(TestContext&) {
  auto now = PeerTable::Clock::now();
  return LanShareCLI::format_age(now - 3200ms, now) == "3.2s ago" &&
         LanShareCLI::format_age(now + 1s, now) == "0.0s ago";
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"announcement_round_trip", test_announcement_round_trip},
    {"message_round_trip", test_message_round_trip},
    {"wire_shape", test_wire_shape},
    {"decode_rejects_malformed", test_decode_rejects_malformed},
    {"decode_ignores_unknown_fields", test_decode_ignores_unknown_fields},
    {"timestamp_formats", test_timestamp_formats},
    {"timestamp_survives_dst_fall_back", test_timestamp_survives_dst_fall_back},
    {"message_ids_are_uuid_v4", test_message_ids_are_uuid_v4},
    {"peer_expires_after_timeout", test_peer_expires_after_timeout},
    {"reannounce_keeps_peer_alive", test_reannounce_keeps_peer_alive},
    {"first_seen_never_after_last_seen", test_first_seen_never_after_last_seen},
    {"peer_address_follows_latest_announcement", test_peer_address_follows_latest_announcement},
    {"active_peers_sorted", test_active_peers_sorted},
    {"log_listener_may_read_peer_table", test_log_listener_may_read_peer_table},
    {"tables_under_concurrent_access", test_tables_under_concurrent_access},
    {"conversation_id", test_conversation_id},
    {"store_queries", test_store_queries},
    {"store_keeps_duplicates", test_store_keeps_duplicates},
    {"dispatch_announcements", test_dispatch_announcements},
    {"dispatch_messages", test_dispatch_messages},
    {"dispatch_keeps_sender_time", test_dispatch_keeps_sender_time},
    {"dispatch_malformed", test_dispatch_malformed},
    {"settings_defaults_and_aliases", test_settings_defaults_and_aliases},
    {"settings_type_checks", test_settings_type_checks},
    {"settings_persist", test_settings_persist},
    {"command_line_positional", test_command_line_positional},
    {"command_line_options", test_command_line_options},
    {"command_line_errors", test_command_line_errors},
    {"debug_log_capacity", test_debug_log_capacity},
    {"message_command_parsing", test_message_command_parsing},
    {"age_formatting", test_age_formatting},
  };
  return lanshare::test::run_tests("core", tests, argc, argv);
}
