#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {

enum class SinkKind { Console, Errors, Report, ReportErr };

struct Route {
  const char* name;
  spdlog::level::level_enum level;
  SinkKind sink;
};

// Indexed by LogChannel.
constexpr Route kRoutes[] = {
  {"info",       spdlog::level::info,  SinkKind::Console},
  {"warn",       spdlog::level::warn,  SinkKind::Console},
  {"error",      spdlog::level::err,   SinkKind::Errors},
  {"verbose",    spdlog::level::debug, SinkKind::Console},
  {"debug",      spdlog::level::trace, SinkKind::Console},
  {"report",     spdlog::level::info,  SinkKind::Report},
  {"report_err", spdlog::level::err,   SinkKind::ReportErr},
};

const Route& route(LogChannel channel) {
  return kRoutes[static_cast<std::size_t>(channel)];
}

constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct Sinks {
  std::shared_ptr<spdlog::logger> console;
  std::shared_ptr<spdlog::logger> errors;
  std::shared_ptr<spdlog::logger> report;
  std::shared_ptr<spdlog::logger> report_err;

  spdlog::logger& pick(SinkKind kind) const {
    switch(kind) {
      case SinkKind::Errors: return *errors;
      case SinkKind::Report: return *report;
      case SinkKind::ReportErr: return *report_err;
      case SinkKind::Console: break;
    }
    return *console;
  }
};

std::shared_ptr<spdlog::logger> make_sink_logger(const char* name, bool to_stderr, const char* pattern) {
  spdlog::sink_ptr sink;
  if(to_stderr) {
    sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  } else {
    sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  }
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  spdlog::register_logger(logger);
  return logger;
}

Sinks& sinks() {
  static Sinks instance = [] {
    Sinks s;
    s.console = make_sink_logger("flatten.console", false, kTimestampPattern);
    s.errors = make_sink_logger("flatten.errors", true, kTimestampPattern);
    s.report = make_sink_logger("flatten.report", false, "%v");
    s.report_err = make_sink_logger("flatten.report_err", true, "%v");
    s.console->flush_on(spdlog::level::warn);
    s.errors->flush_on(spdlog::level::err);
    s.report->flush_on(spdlog::level::info);
    s.report_err->flush_on(spdlog::level::err);
    return s;
  }();
  return instance;
}

std::atomic<bool> g_passthrough{true};

} // namespace

const char* log_channel_name(LogChannel channel) {
  return route(channel).name;
}

spdlog::level::level_enum log_channel_level(LogChannel channel) {
  return route(channel).level;
}

bool log_channel_open(LogChannel channel) {
  const auto& r = route(channel);
  return sinks().pick(r.sink).should_log(r.level);
}

void init(bool verbose, bool debug) {
  auto& s = sinks();
  auto level = debug ? spdlog::level::trace
                     : (verbose ? spdlog::level::debug : spdlog::level::info);
  s.console->set_level(level);
  s.errors->set_level(spdlog::level::info);
  s.report->set_level(spdlog::level::info);
  s.report_err->set_level(spdlog::level::info);
  spdlog::set_default_logger(s.console);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_passthrough.load(std::memory_order_acquire);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::make_pair(user_data, std::move(listener)));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::wanted(LogChannel channel) const {
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(!listeners_.empty()) return true;
  }
  return log_channel_open(channel);
}

void Logger::deliver(LogChannel channel, const std::string& message) {
  std::vector<std::pair<void*, Listener>> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }

  const std::string tagged = name_.empty() ? std::string(log_channel_name(channel))
                                           : name_ + ":" + log_channel_name(channel);
  bool consumed = false;
  for(auto& listener : snapshot) {
    try {
      consumed = listener.second(listener.first, tagged, log_channel_level(channel), message) || consumed;
    } catch(const std::exception& e) {
      detail::emit(LogChannel::Error, "log", fmt::format("log listener threw: {}", e.what()));
    }
  }
  if(consumed || !log_channel_open(channel)) return;
  detail::emit(channel, tagged, message);
}

namespace detail {

void emit(LogChannel channel, const std::string& source, const std::string& message) {
  if(!log_passthrough()) return;
  const auto& r = route(channel);
  auto& sink = sinks().pick(r.sink);
  if(source.empty()) {
    sink.log(r.level, message);
  } else {
    sink.log(r.level, fmt::format("[{}] {}", source, message));
  }
}

} // namespace detail
