#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "log.hpp"

std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    if(entry.contains("aliases")) {
      for(const auto& alias : entry.at("aliases")) {
        spec.aliases.push_back(to_lower(alias.get<std::string>()));
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specs_(build_setting_specs(specification)) {
  reset_to_defaults();
}

void SettingsManager::reset_to_defaults() {
  std::lock_guard lg(m_);
  values_ = nlohmann::json::object();
  for(const auto& spec : specs_) {
    values_[spec.key] = spec.default_value;
  }
}

const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(trim_copy(token));
  auto it = std::find_if(specs_.begin(), specs_.end(), [&](const SettingSpec& spec){
    return to_lower(spec.key) == lowered ||
           std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end();
  });
  return it == specs_.end() ? nullptr : &*it;
}

bool SettingsManager::has(const std::string& key) const {
  std::lock_guard lg(m_);
  return values_.contains(key);
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(specs_.size());
  for(const auto& spec : specs_) out.push_back(spec.key);
  return out;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  std::lock_guard lg(m_);
  auto it = values_.find(key);
  if(it == values_.end()) return "<unknown>";
  if(it->is_string()) return it->get<std::string>();
  if(it->is_boolean()) return it->get<bool>() ? "true" : "false";
  return it->dump();
}

std::string SettingsManager::description(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec ? spec->description : std::string();
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  std::lock_guard lg(m_);
  settings_path_override_ = path;
}

std::filesystem::path SettingsManager::settings_path() const {
  {
    std::lock_guard lg(m_);
    if(!settings_path_override_.empty()) {
      return settings_path_override_;
    }
  }
  if(const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".lanshare.conf";
  }
  return std::filesystem::current_path() / ".lanshare.conf";
}

bool SettingsManager::load() {
  return load_from_file(settings_path());
}

bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err("Error loading config {}: {}", path.string(), e.what());
    return false;
  }
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err("Error saving config: unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error)) {
      print_err("Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  std::lock_guard lg(m_);
  for(const auto& spec : specs_) {
    if(persistent_only && !spec.persistent) continue;
    auto it = values_.find(spec.key);
    if(it != values_.end()) doc[spec.key] = *it;
  }
  return doc;
}

bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                        const nlohmann::json& value,
                                        std::string& error) {
  nlohmann::json converted;
  if(spec.type == "bool") {
    if(value.is_boolean()) converted = value.get<bool>();
    else if(value.is_number_integer()) converted = (value.get<int>() != 0);
    else error = "expected boolean";
  } else if(spec.type == "int") {
    if(value.is_number_integer()) converted = value.get<int>();
    else error = "expected integer";
  } else if(spec.type == "float") {
    if(value.is_number()) converted = value.get<double>();
    else error = "expected number";
  } else if(spec.type == "string") {
    if(value.is_string()) converted = value.get<std::string>();
    else error = "expected string";
  } else if(spec.type == "json") {
    converted = value;
  } else {
    error = "unknown type";
  }
  if(!error.empty()) return false;

  std::lock_guard lg(m_);
  values_[spec.key] = std::move(converted);
  return true;
}

nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                   const std::string& value,
                                                   std::string& error) {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  try {
    std::size_t used = 0;
    if(spec.type == "int") {
      int parsed = std::stoi(clean, &used);
      if(used == clean.size()) return parsed;
      error = "trailing characters in integer";
      return {};
    }
    if(spec.type == "float") {
      double parsed = std::stod(clean, &used);
      if(used == clean.size()) return parsed;
      error = "trailing characters in number";
      return {};
    }
    if(spec.type == "json") {
      return nlohmann::json::parse(clean);
    }
  } catch(const std::exception& e) {
    error = e.what();
    return {};
  }
  if(spec.type == "string") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

bool SettingsManager::set_from_string(const std::string& key,
                                      const std::string& value,
                                      std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

bool SettingsManager::set_from_json(const std::string& key,
                                    const nlohmann::json& value,
                                    std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

bool SettingsManager::is_bool_literal(const std::string& value) {
  std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}
