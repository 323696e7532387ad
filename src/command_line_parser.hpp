#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto settings: "--key value", "-alias value", bare "--flag" for
// booleans, and positional arguments in argv_spec order.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "lanshare",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","username"}},
                      {{"index",1},{"key","port"}}
                    }));

  // Returns false and fills `error` on the first bad argument.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  nlohmann::json settings_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
