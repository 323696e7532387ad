#include <cpptrace/cpptrace.hpp>
#include <iomanip>
#include <random>
#include <sstream>

#include "command_line_parser.hpp"
#include "debug_log.hpp"
#include "discovery_engine.hpp"
#include "lanshare_cli.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

// Two sessions on one LAN may share a base name; the suffix keeps the
// announced usernames apart.
std::string make_unique_username(const std::string& base) {
  std::random_device rd;
  std::uniform_int_distribution<int> dist(0, 0xffff);
  std::ostringstream oss;
  oss << base << "#" << std::hex << std::setw(4) << std::setfill('0') << dist(rd);
  return oss.str();
}

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "lanshare");
    std::string error;
    if(!parser.parse(argc, argv, *settings, error)) {
      print_err("{}", error);
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings->get<bool>("verbose"));
    Logger logger("lanshare");

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger.error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    auto base_name = SettingsManager::trim_copy(settings->get<std::string>("username"));
    if(base_name.empty()) {
      print_err("A username is required: lanshare <username> [port] or --username=<name>");
      parser.usage();
      return 1;
    }

    int capacity = settings->get<int>("max_debug_messages");
    auto debug_log = std::make_shared<DebugLog>(capacity > 0 ? static_cast<std::size_t>(capacity) : 1);

    DiscoveryEngine::Options options;
    options.username = make_unique_username(base_name);
    auto engine = std::make_shared<DiscoveryEngine>(settings, options);

    engine->start();
    // the shell owns the terminal from here; the debug log still sees
    // every engine line
    set_log_passthrough(settings->get<bool>("verbose"));
    {
      LanShareCLI cli(engine, debug_log);
      cli.run();
    }
    engine->stop();
    return 0;
  } catch(std::exception& e) {
    init(false);
    set_log_passthrough(true);
    Logger logger("lanshare-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
