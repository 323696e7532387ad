#pragma once
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <readline/readline.h>
#include <readline/history.h>

#include "debug_log.hpp"
#include "discovery_engine.hpp"
#include "peer_table.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"
#include "transport.hpp"

class LanShareCLI {
public:
  struct MessageCommand {
    std::string recipient;
    std::string title;
    std::string content;
  };

  LanShareCLI(std::shared_ptr<DiscoveryEngine> engine, std::shared_ptr<DebugLog> debug_log)
    : engine_(std::move(engine)), debug_log_(std::move(debug_log)) {
    prompt_ = engine_->username() + "@LAN(" + local_ip_address() + ")# ";
    engine_->set_message_callback([this](const Message& message){
      on_message(message);
    });
    if(debug_log_) {
      auto log = debug_log_;
      engine_->set_debug_sink([log](const std::string& line){
        log->append(line);
      });
    }
  }

  ~LanShareCLI() {
    engine_->set_message_callback(nullptr);
    engine_->set_debug_sink(nullptr);
  }

  LanShareCLI(const LanShareCLI&) = delete;
  LanShareCLI& operator=(const LanShareCLI&) = delete;

  // Blocks until exit/quit or end of input.
  void run() {
    std::cout << "\nWelcome to LAN Share, " << engine_->username() << "!\n";
    std::cout << "Type 'help' for available commands\n";
    while(true) {
      auto input = read_command_line(prompt_.c_str());
      if(!input) break;
      if(!execute(*input)) break;
    }
  }

  // Runs one command line. Returns false when the shell should exit.
  bool execute(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    if(cmd.empty()) return true;
    cmd = SettingsManager::to_lower(cmd);

    std::string args;
    std::getline(iss, args);
    args = SettingsManager::trim_copy(args);

    if(cmd == "ul" || cmd == "users") {
      list_users();
    } else if(cmd == "msg") {
      send_command(args);
    } else if(cmd == "reply") {
      reply_command(args);
    } else if(cmd == "messages") {
      list_messages(args);
    } else if(cmd == "conv") {
      show_conversation(args);
    } else if(cmd == "debug") {
      debug_command(args);
    } else if(cmd == "log") {
      log_command(args);
    } else if(cmd == "settings") {
      list_settings();
    } else if(cmd == "set") {
      set_command(args);
    } else if(cmd == "save") {
      save_settings();
    } else if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
    } else if(cmd == "clear") {
      std::cout << "\x1b[2J\x1b[H";
      std::cout.flush();
    } else if(cmd == "exit" || cmd == "quit") {
      std::cout << "Goodbye!\n";
      return false;
    } else {
      std::cout << "Unknown command: " << cmd << "\n";
      std::cout << "Type 'help' for available commands\n";
    }
    return true;
  }

  // "<user> <title> | <content>"; the title may contain spaces.
  static std::optional<MessageCommand> parse_message_command(const std::string& args) {
    std::istringstream iss(args);
    MessageCommand command;
    if(!(iss >> command.recipient)) return std::nullopt;
    std::string rest;
    std::getline(iss, rest);
    auto bar = rest.find('|');
    if(bar == std::string::npos) return std::nullopt;
    command.title = SettingsManager::trim_copy(rest.substr(0, bar));
    command.content = SettingsManager::trim_copy(rest.substr(bar + 1));
    if(command.title.empty() || command.content.empty()) return std::nullopt;
    return command;
  }

  static std::string format_age(PeerTable::Clock::time_point then, PeerTable::Clock::time_point now) {
    auto age = std::chrono::duration<double>(now - then).count();
    if(age < 0) age = 0;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << age << "s ago";
    return oss.str();
  }

  static std::string format_clock_time(const Timestamp& timestamp) {
    auto t = std::chrono::system_clock::to_time_t(
      std::chrono::time_point_cast<std::chrono::system_clock::duration>(timestamp));
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
  }

private:
  static constexpr std::size_t kShortIdLength = 8;

  std::optional<std::string> read_command_line(const char* prompt) {
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    return result;
  }

  void on_message(const Message& message) {
    std::lock_guard lg(output_mutex_);
    std::cout << "\n[" << format_clock_time(message.timestamp) << "] New message from "
              << message.sender << ": " << message.title << "\n"
              << "  " << message.content << "\n"
              << "  (reply " << short_id(message.id) << " <text>)\n"
              << prompt_;
    std::cout.flush();
  }

  static std::string short_id(const std::string& id) {
    return id.substr(0, kShortIdLength);
  }

  void list_users() {
    auto peers = engine_->list_peers();
    if(peers.empty()) {
      std::cout << "No users online.\n";
      return;
    }
    auto now = PeerTable::Clock::now();
    std::cout << std::left << std::setw(24) << "USERNAME"
              << std::setw(18) << "ADDRESS"
              << std::setw(14) << "FIRST SEEN"
              << "LAST SEEN\n";
    for(const auto& peer : peers) {
      std::cout << std::left << std::setw(24) << peer.username
                << std::setw(18) << peer.address
                << std::setw(14) << format_age(peer.first_seen, now)
                << format_age(peer.last_seen, now) << "\n";
    }
    std::cout << peers.size() << " user(s) online.\n";
  }

  void report_send(const DiscoveryEngine::SendResult& result, const std::string& recipient) {
    switch(result.status) {
    case DiscoveryEngine::SendResult::Status::Sent:
      std::cout << "Message sent to " << recipient << " (" << short_id(result.message->id) << ").\n";
      break;
    case DiscoveryEngine::SendResult::Status::PeerUnknown:
      std::cout << "User '" << recipient << "' is not online. Use 'ul' to list users.\n";
      break;
    case DiscoveryEngine::SendResult::Status::TransportFailed:
      std::cout << "Failed to send message: " << result.error << "\n";
      break;
    }
  }

  void send_command(const std::string& args) {
    auto command = parse_message_command(args);
    if(!command) {
      std::cout << "Usage: msg <user> <title> | <content>\n";
      return;
    }
    report_send(engine_->send_message(command->recipient, command->title, command->content),
                command->recipient);
  }

  std::optional<Message> find_message(const std::string& id_prefix) {
    std::optional<Message> found;
    for(auto& message : engine_->list_messages()) {
      if(message.id.rfind(id_prefix, 0) != 0) continue;
      if(found && found->id == message.id) continue;
      if(found) {
        std::cout << "Message id '" << id_prefix << "' is ambiguous.\n";
        return std::nullopt;
      }
      found = std::move(message);
    }
    if(!found) {
      std::cout << "No message with id '" << id_prefix << "'.\n";
    }
    return found;
  }

  void reply_command(const std::string& args) {
    std::istringstream iss(args);
    std::string id;
    iss >> id;
    std::string content;
    std::getline(iss, content);
    content = SettingsManager::trim_copy(content);
    if(id.empty() || content.empty()) {
      std::cout << "Usage: reply <message-id> <content>\n";
      return;
    }
    auto parent = find_message(id);
    if(!parent) return;

    const auto& me = engine_->username();
    std::string recipient = parent->sender == me ? parent->recipient : parent->sender;
    std::string title = parent->title.rfind("Re: ", 0) == 0 ? parent->title : "Re: " + parent->title;
    report_send(engine_->send_message(recipient, title, content,
                                      parent->conversation_id, parent->id),
                recipient);
  }

  void print_messages(const std::vector<Message>& messages) {
    const auto& me = engine_->username();
    for(const auto& message : messages) {
      std::cout << "[" << format_clock_time(message.timestamp) << "] "
                << (message.sender == me ? "you" : message.sender) << " -> "
                << (message.recipient == me ? "you" : message.recipient) << ": "
                << message.title << "  (" << short_id(message.id);
      if(message.conversation_id) {
        std::cout << ", conv " << *message.conversation_id;
      }
      std::cout << ")\n  " << message.content << "\n";
    }
  }

  void list_messages(const std::string& peer) {
    auto messages = engine_->list_messages(peer.empty() ? std::nullopt : std::optional<std::string>(peer));
    if(messages.empty()) {
      std::cout << (peer.empty() ? "No messages.\n" : "No messages with " + peer + ".\n");
      return;
    }
    print_messages(messages);
  }

  void show_conversation(const std::string& id) {
    if(id.empty()) {
      std::cout << "Usage: conv <conversation-id>\n";
      return;
    }
    auto messages = engine_->get_conversation(id);
    if(messages.empty()) {
      std::cout << "No messages in conversation " << id << ".\n";
      return;
    }
    print_messages(messages);
  }

  void debug_command(const std::string& args) {
    if(args.empty()) {
      std::cout << "Debug logging is " << (engine_->debug_logging() ? "on" : "off") << ".\n";
      return;
    }
    auto value = SettingsManager::to_lower(args);
    bool enabled = false;
    if(value == "on") {
      enabled = true;
    } else if(value != "off") {
      std::cout << "Usage: debug [on|off]\n";
      return;
    }
    auto settings = engine_->settings();
    std::string error;
    if(!settings->set_from_string("debug", enabled ? "true" : "false", error)) {
      std::cout << "Failed to set debug: " << error << "\n";
      return;
    }
    engine_->set_debug_logging(enabled);
    if(!settings->save()) {
      std::cout << "Failed to save settings.\n";
    }
    std::cout << "Debug logging " << (enabled ? "enabled" : "disabled") << ".\n";
  }

  void log_command(const std::string& args) {
    if(!debug_log_) {
      std::cout << "Debug log unavailable.\n";
      return;
    }
    if(args == "clear") {
      debug_log_->clear();
      std::cout << "Debug log cleared.\n";
      return;
    }
    if(!args.empty()) {
      std::cout << "Usage: log [clear]\n";
      return;
    }
    auto entries = debug_log_->entries();
    if(entries.empty()) {
      std::cout << (engine_->debug_logging()
                    ? "Debug log is empty.\n"
                    : "Debug log is empty. Enable it with 'debug on'.\n");
      return;
    }
    for(const auto& entry : entries) {
      std::cout << "[" << entry.time << "] " << entry.message << "\n";
    }
  }

  void list_settings() {
    auto settings = engine_->settings();
    for(const auto& key : settings->keys()) {
      std::cout << "  " << std::left << std::setw(20) << key
                << std::setw(18) << settings->value_as_string(key)
                << settings->description(key) << "\n";
    }
  }

  void set_command(const std::string& args) {
    std::istringstream iss(args);
    std::string key;
    iss >> key;
    std::string value;
    std::getline(iss, value);
    value = SettingsManager::trim_copy(value);
    if(key.empty() || value.empty()) {
      std::cout << "Usage: set <key> <value>\n";
      return;
    }
    auto settings = engine_->settings();
    auto resolved = settings->resolve_key(key);
    if(!resolved) {
      std::cout << "Unknown setting '" << key << "'.\n";
      return;
    }
    std::string error;
    if(!settings->set_from_string(*resolved, value, error)) {
      std::cout << "Failed to set " << *resolved << ": " << error << "\n";
      return;
    }
    apply_setting(*resolved);
    std::cout << *resolved << " = " << settings->value_as_string(*resolved) << "\n";
  }

  void apply_setting(const std::string& key) {
    auto settings = engine_->settings();
    if(key == "debug") {
      engine_->set_debug_logging(settings->get<bool>("debug"));
    } else if(key == "max_debug_messages") {
      if(debug_log_) {
        int capacity = settings->get<int>("max_debug_messages");
        debug_log_->set_capacity(capacity > 0 ? static_cast<std::size_t>(capacity) : 1);
      }
    } else if(key == "port" || key == "peer_timeout" || key == "broadcast_interval" ||
              key == "broadcast_address" || key == "stamp_receipt_time" || key == "username") {
      std::cout << "Takes effect after restart.\n";
    }
  }

  void save_settings() {
    auto settings = engine_->settings();
    if(settings->save()) {
      std::cout << "Saved settings to " << settings->settings_path() << "\n";
    } else {
      std::cout << "Failed to save settings.\n";
    }
  }

  void print_help() {
    std::cout << "Available commands:\n";
    std::cout << "  ul|users                         List online users\n";
    std::cout << "  msg <user> <title> | <content>   Send a message\n";
    std::cout << "  reply <message-id> <content>     Reply to a message\n";
    std::cout << "  messages [user]                  List messages, optionally with one user\n";
    std::cout << "  conv <conversation-id>           Show one conversation\n";
    std::cout << "  debug [on|off]                   Show or toggle debug logging (saved)\n";
    std::cout << "  log [clear]                      Show or clear the debug log\n";
    std::cout << "  settings                         List settings\n";
    std::cout << "  set <key> <value>                Change a setting\n";
    std::cout << "  save                             Save settings\n";
    std::cout << "  clear                            Clear the screen\n";
    std::cout << "  help|h|?                         Show this help message\n";
    std::cout << "  exit|quit                        Exit the session\n";
  }

  std::shared_ptr<DiscoveryEngine> engine_;
  std::shared_ptr<DebugLog> debug_log_;
  std::string prompt_;
  std::mutex output_mutex_;
};
