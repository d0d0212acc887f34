#include "log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstring>
#include <memory>
#include <vector>

namespace {

constexpr std::size_t kLogFileBytes = 5 * 1024 * 1024;
constexpr std::size_t kLogFileCount = 3;

std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> g_file_sink;
std::mutex g_init_mutex;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  if(g_info_logger) return;

  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = std::make_shared<spdlog::logger>("rcpilot.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("rcpilot.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("rcpilot.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("rcpilot.print_err", std::move(plain_err_sink));

  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void attach_file_sink(const std::filesystem::path& log_file) {
  if(g_file_sink || log_file.empty()) return;
  std::error_code ec;
  if(log_file.has_parent_path()) {
    std::filesystem::create_directories(log_file.parent_path(), ec);
  }
  try {
    g_file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      log_file.string(), kLogFileBytes, kLogFileCount);
  } catch(const spdlog::spdlog_ex& e) {
    g_error_logger->warn("Unable to open log file {}: {}", log_file.string(), e.what());
    return;
  }
  g_file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  g_info_logger->sinks().push_back(g_file_sink);
  g_error_logger->sinks().push_back(g_file_sink);
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
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
    if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
      handled = true;
    }
  }
  return handled;
}

void Logger::emit(const char* base_channel,
                  spdlog::level::level_enum level,
                  const std::string& message) {
  bool plain = std::strcmp(base_channel, "print") == 0 ||
               std::strcmp(base_channel, "print_err") == 0;
  detail::emit_to_default(base_channel, plain ? std::string() : name_, level, message);
}

void init(bool verbose, const std::filesystem::path& log_file) {
  std::lock_guard<std::mutex> lock(g_init_mutex);
  create_loggers();
  attach_file_sink(log_file);

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);
  if(g_file_sink) g_file_sink->set_level(level);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& prefix,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    create_loggers();
  }
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  if(std::strcmp(base_channel, "print") == 0) {
    sink = g_print_logger.get();
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = g_print_err_logger.get();
  } else if(std::strcmp(base_channel, "error") == 0) {
    sink = g_error_logger.get();
  } else {
    sink = g_info_logger.get();
  }

  if(prefix.empty()) {
    sink->log(level, message);
  } else {
    sink->log(level, fmt::format("[{}] {}", prefix, message));
  }
}

} // namespace detail
