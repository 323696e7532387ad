#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","username"},            {"aliases", {"u","user"}},       {"type","string"}, {"default",""},        {"description","Name announced to the LAN (a #xxxx suffix is appended)"}, {"persistent", true}},
  {{"key","port"},                {"aliases", {"p"}},              {"type","int"},    {"default",12345},     {"description","UDP port for announcements and messages"}, {"persistent", true}},
  {{"key","peer_timeout"},        {"aliases", {"timeout","pt"}},   {"type","float"},  {"default",2.0},       {"description","Seconds without an announcement before a peer is dropped"}, {"persistent", true}},
  {{"key","broadcast_interval"},  {"aliases", {"interval","bi"}},  {"type","float"},  {"default",0.1},       {"description","Seconds between presence broadcasts"}, {"persistent", true}},
  {{"key","broadcast_address"},   {"aliases", {"ba"}},             {"type","string"}, {"default","255.255.255.255"}, {"description","IPv4 address announcements are sent to"}, {"persistent", true}},
  {{"key","stamp_receipt_time"},  {"aliases", {"srt"}},            {"type","bool"},   {"default",true},      {"description","Replace a received message's timestamp with local receipt time"}, {"persistent", true}},
  {{"key","debug"},               {"aliases", {"d"}},              {"type","bool"},   {"default",false},     {"description","Record engine events in the debug log"}, {"persistent", true}},
  {{"key","max_debug_messages"},  {"aliases", {"mdm"}},            {"type","int"},    {"default",100},       {"description","Number of debug log lines kept"}, {"persistent", true}},
  {{"key","verbose"},             {"aliases", {"v"}},              {"type","bool"},   {"default",false},     {"description","Enable verbose console logging"}, {"persistent", true}},
  {{"key","help"},                {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},        {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

// Typed key/value settings described by a JSON specification (key, aliases,
// type, default, description, persistent). Keys and aliases match
// case-insensitively. Types: bool, int, float, string, json.
class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);
  void reset_to_defaults();

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::string description(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  // $HOME/.lanshare.conf unless overridden.
  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void merge_from_json(const nlohmann::json& doc);
  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  static nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error);

  std::vector<SettingSpec> specs_;
  mutable std::mutex m_;
  nlohmann::json values_;
  std::filesystem::path settings_path_override_;
};

template<typename T>
T SettingsManager::get(const std::string& key) const {
  std::lock_guard lg(m_);
  auto it = values_.find(key);
  if(it == values_.end()) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return it->template get<T>();
}
