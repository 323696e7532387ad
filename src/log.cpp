#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <exception>
#include <vector>

namespace {

// One spdlog logger per console destination.
enum Sink : std::size_t { kStatusOut, kStatusErr, kPlainOut, kPlainErr, kSinkCount };

std::array<std::shared_ptr<spdlog::logger>, kSinkCount> g_sinks;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

template<typename SinkType>
std::shared_ptr<spdlog::logger> make_console(const char* name, const char* pattern) {
  auto sink = std::make_shared<SinkType>();
  sink->set_pattern(pattern);
  return std::make_shared<spdlog::logger>(name, std::move(sink));
}

void create_loggers() {
  const char* status_pattern = "[%H:%M:%S.%e] [%^%l%$] %v";
  g_sinks[kStatusOut] = make_console<spdlog::sinks::stdout_color_sink_mt>("lanshare.info", status_pattern);
  g_sinks[kStatusErr] = make_console<spdlog::sinks::stderr_color_sink_mt>("lanshare.error", status_pattern);
  g_sinks[kPlainOut] = make_console<spdlog::sinks::stdout_color_sink_mt>("lanshare.print", "%v");
  g_sinks[kPlainErr] = make_console<spdlog::sinks::stderr_color_sink_mt>("lanshare.print_err", "%v");

  g_sinks[kStatusOut]->set_level(spdlog::level::info);
  g_sinks[kStatusOut]->flush_on(spdlog::level::warn);
  g_sinks[kStatusErr]->flush_on(spdlog::level::err);
  g_sinks[kPlainOut]->flush_on(spdlog::level::info);
  g_sinks[kPlainErr]->flush_on(spdlog::level::err);
}

spdlog::logger& sink_for(LogChannel channel) {
  std::call_once(g_create_once, create_loggers);
  switch(channel) {
  case LogChannel::Print:    return *g_sinks[kPlainOut];
  case LogChannel::PrintErr: return *g_sinks[kPlainErr];
  case LogChannel::Error:    return *g_sinks[kStatusErr];
  default:                   return *g_sinks[kStatusOut];
  }
}

} // namespace

const char* log_channel_name(LogChannel channel) {
  switch(channel) {
  case LogChannel::Info:     return "info";
  case LogChannel::Warn:     return "warn";
  case LogChannel::Error:    return "error";
  case LogChannel::Debug:    return "debug";
  case LogChannel::Print:    return "print";
  case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum log_channel_level(LogChannel channel) {
  switch(channel) {
  case LogChannel::Warn:     return spdlog::level::warn;
  case LogChannel::Error:
  case LogChannel::PrintErr: return spdlog::level::err;
  case LogChannel::Debug:    return spdlog::level::debug;
  default:                   return spdlog::level::info;
  }
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose) {
  sink_for(LogChannel::Info).set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  for(std::size_t i = kStatusErr; i < kSinkCount; ++i) {
    g_sinks[i]->set_level(spdlog::level::info);
  }
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  std::lock_guard lg(name_mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard lg(name_mutex_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard lg(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard lg(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard lg(listener_mutex_);
  listeners_.clear();
}

std::size_t Logger::listener_count() const {
  std::lock_guard lg(listener_mutex_);
  return listeners_.size();
}

void Logger::write(LogChannel channel, const std::string& message) {
  const std::string label = name();
  const std::string channel_name = label.empty()
    ? std::string(log_channel_name(channel))
    : label + ":" + log_channel_name(channel);
  if(dispatch(channel_name, log_channel_level(channel), message)) return;
  detail::emit_to_console(channel, label.empty() ? std::string() : channel_name, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  // listeners run unlocked so they may add or remove listeners themselves
  std::vector<Listener> snapshot;
  {
    std::lock_guard lg(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    try {
      handled = listener(channel, level, message) || handled;
    } catch(const std::exception& e) {
      detail::emit_to_console(LogChannel::Error, channel,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

namespace detail {

void emit_to_console(LogChannel channel, const std::string& label, const std::string& message) {
  auto& sink = sink_for(channel);
  if(!log_passthrough()) return;
  auto level = log_channel_level(channel);
  if(label.empty()) {
    sink.log(level, message);
  } else {
    sink.log(level, fmt::format("[{}] {}", label, message));
  }
}

} // namespace detail
