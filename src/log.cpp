#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <exception>
#include <mutex>
#include <vector>

namespace {
constexpr const char* kStampedPattern = "%Y-%m-%d %H:%M:%S [%^%l%$] %v";

std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::shared_ptr<spdlog::sinks::basic_file_sink_mt> g_file_sink;
std::mutex g_setup_mutex;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr sink,
                                            spdlog::level::level_enum flush_level) {
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::drop(name);
  spdlog::register_logger(logger);
  return logger;
}

void create_loggers_locked() {
  if(g_info_logger) return;

  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kStampedPattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kStampedPattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = make_logger("migrate.info", std::move(info_sink), spdlog::level::warn);
  g_error_logger = make_logger("migrate.error", std::move(error_sink), spdlog::level::err);
  g_print_logger = make_logger("migrate.print", std::move(plain_out_sink), spdlog::level::info);
  g_print_err_logger = make_logger("migrate.print_err", std::move(plain_err_sink), spdlog::level::err);
}

void ensure_loggers() {
  std::lock_guard<std::mutex> lock(g_setup_mutex);
  create_loggers_locked();
}

void attach_file_sink_locked(const std::string& log_file) {
  if(log_file.empty() || g_file_sink) return;
  try {
    g_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  } catch(const spdlog::spdlog_ex& e) {
    g_error_logger->warn("Log file {} unavailable: {}", log_file, e.what());
    return;
  }
  g_file_sink->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
  g_info_logger->sinks().push_back(g_file_sink);
  g_error_logger->sinks().push_back(g_file_sink);
}

spdlog::logger* sink_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Print: return g_print_logger.get();
    case LogChannel::PrintErr: return g_print_err_logger.get();
    case LogChannel::Error: return g_error_logger.get();
    default: return g_info_logger.get();
  }
}

} // namespace

const char* channel_label(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug: return spdlog::level::debug;
    default: return spdlog::level::info;
  }
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

std::string default_log_file_path() {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &local);
  return std::string("/var/log/disk-migration-") + stamp + ".log";
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

void Logger::emit(LogChannel channel, const std::string& message) {
  const char* label = channel_label(channel);
  std::string channel_name = name_.empty() ? std::string(label) : name_ + ":" + label;
  if(dispatch(channel_name, channel_level(channel), message)) return;
  detail::emit_to_default(channel, channel_name, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default(LogChannel::Warn, channel,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void init(bool verbose, const std::string& log_file, bool console_to_stderr) {
  std::lock_guard<std::mutex> lock(g_setup_mutex);
  create_loggers_locked();
  if(console_to_stderr) {
    auto stamped = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    stamped->set_pattern(kStampedPattern);
    g_info_logger->sinks().front() = stamped;
    auto plain = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    plain->set_pattern("%v");
    g_print_logger->sinks().front() = plain;
  }
  attach_file_sink_locked(log_file);

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& channel_name,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = sink_for(channel);
  if(!sink) return;
  if(!channel_name.empty() && channel_name != channel_label(channel)) {
    sink->log(channel_level(channel), fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(channel_level(channel), message);
  }
}

} // namespace detail
