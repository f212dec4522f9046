#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace {

struct ConsoleLoggers {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> plain;
  std::shared_ptr<spdlog::logger> plain_err;
};

ConsoleLoggers g_console;
std::once_flag g_console_once;
std::atomic<bool> g_log_echo{true};

constexpr const char* kStampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_console(const std::string& name,
                                             spdlog::sink_ptr sink,
                                             const char* pattern,
                                             spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

ConsoleLoggers& console() {
  std::call_once(g_console_once, [](){
    using spdlog::sinks::stderr_color_sink_mt;
    using spdlog::sinks::stdout_color_sink_mt;
    g_console.info = make_console("zktree.info", std::make_shared<stderr_color_sink_mt>(),
                                  kStampPattern, spdlog::level::warn);
    g_console.error = make_console("zktree.error", std::make_shared<stderr_color_sink_mt>(),
                                   kStampPattern, spdlog::level::err);
    // Listings must stay pipeable: no prefix, flushed per line.
    g_console.plain = make_console("zktree.print", std::make_shared<stdout_color_sink_mt>(),
                                   "%v", spdlog::level::info);
    g_console.plain_err = make_console("zktree.print_err", std::make_shared<stderr_color_sink_mt>(),
                                       "%v", spdlog::level::err);
  });
  return g_console;
}

spdlog::logger& console_for(LogSink sink) {
  auto& loggers = console();
  switch(sink) {
    case LogSink::Error: return *loggers.error;
    case LogSink::Plain: return *loggers.plain;
    case LogSink::PlainErr: return *loggers.plain_err;
    case LogSink::Info: break;
  }
  return *loggers.info;
}

const char* method_for(LogSink sink, spdlog::level::level_enum level) {
  switch(sink) {
    case LogSink::Plain: return "print";
    case LogSink::PlainErr: return "print_err";
    case LogSink::Error: return "error";
    case LogSink::Info: break;
  }
  switch(level) {
    case spdlog::level::debug: return "debug";
    case spdlog::level::warn: return "warn";
    default: return "info";
  }
}

void to_console(LogSink sink,
                const std::string& tag,
                spdlog::level::level_enum level,
                const std::string& message) {
  auto& target = console_for(sink);
  if(!log_echo()) return;
  if(tag.empty()) {
    target.log(level, message);
  } else {
    target.log(level, fmt::format("[{}] {}", tag, message));
  }
}

} // namespace

void set_log_echo(bool enabled) {
  g_log_echo.store(enabled, std::memory_order_release);
}

bool log_echo() {
  return g_log_echo.load(std::memory_order_acquire);
}

void init(bool verbose) {
  auto& loggers = console();
  const auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  loggers.info->set_level(level);
  loggers.error->set_level(spdlog::level::info);
  loggers.plain->set_level(spdlog::level::info);
  loggers.plain_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(loggers.info);
  spdlog::set_level(level);
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::notify(const LogRecord& record) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if(listeners_.empty()) return false;
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(const auto& listener : snapshot) {
    if(listener(record)) handled = true;
  }
  return handled;
}

void Logger::write(const char* method,
                   LogSink sink,
                   spdlog::level::level_enum level,
                   std::string message) {
  LogRecord record;
  record.channel = name_.empty() ? std::string(method) : name_ + ":" + method;
  record.sink = sink;
  record.level = level;
  record.message = std::move(message);
  if(notify(record)) return;

  const bool plain = (sink == LogSink::Plain || sink == LogSink::PlainErr);
  to_console(sink, plain ? std::string() : name_, level, record.message);
}

namespace detail {

void route(Logger* logger,
           LogSink sink,
           spdlog::level::level_enum level,
           std::string message) {
  if(logger) {
    logger->write(method_for(sink, level), sink, level, std::move(message));
  } else {
    to_console(sink, std::string(), level, message);
  }
}

} // namespace detail
