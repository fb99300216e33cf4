#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Where a message goes. Progress and diagnostics land on the console sink,
// errors on stderr, and the run report is written without a timestamp.
enum class LogChannel {
  Info,
  Warn,
  Error,
  Verbose,   // --verbose: per-file and per-rule progress
  Debug,     // --debug: hashing and listing internals
  Report,    // usage text and run summary on stdout
  ReportErr  // command-line errors on stderr
};

const char* log_channel_name(LogChannel channel);
spdlog::level::level_enum log_channel_level(LogChannel channel);
// False when the sinks would drop the channel at the current level.
bool log_channel_open(LogChannel channel);

// verbose opens the Verbose channel, debug additionally opens Debug.
void init(bool verbose = false, bool debug = false);

// Tests switch this off so that only listeners see messages.
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

// A named source of messages ("flatten", "worker", ...). Listeners see every
// message, whatever the level; returning true keeps it off the sinks.
class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if(!wanted(channel)) return;
    deliver(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void verbose(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Verbose, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }

private:
  bool wanted(LogChannel channel) const;
  void deliver(LogChannel channel, const std::string& message);

  std::string name_;
  mutable std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, std::pair<void*, Listener>> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
// Sends straight to the sinks, prefixed with "[source]" when source is set.
void emit(LogChannel channel, const std::string& source, const std::string& message);
}

// For code that may run without a Logger (worker helpers, settings loading).
template<typename... Args>
inline void log_to(Logger* logger, LogChannel channel,
                   spdlog::format_string_t<Args...> fmt, Args&&... args) {
  if(logger) {
    logger->write(channel, fmt, std::forward<Args>(args)...);
    return;
  }
  if(!log_channel_open(channel)) return;
  detail::emit(channel, std::string(), fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Error, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_verbose(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Verbose, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::Report, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(logger, LogChannel::ReportErr, fmt, std::forward<Args>(args)...);
}
