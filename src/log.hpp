#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Console routing for log lines. Plain sinks carry no timestamp/level prefix
// and are used for program output (listings, summaries, usage text).
enum class LogSink { Info, Error, Plain, PlainErr };

void init(bool verbose = false);
// Turns console output off and on; listeners still see every line.
void set_log_echo(bool enabled);
bool log_echo();

// One formatted line as seen by listeners. channel is "<logger>:<method>".
struct LogRecord {
  std::string channel;
  LogSink sink = LogSink::Info;
  spdlog::level::level_enum level = spdlog::level::info;
  std::string message;
};

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Returning true marks the line as handled and keeps it off the console.
  using Listener = std::function<bool(const LogRecord& record)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("info", LogSink::Info, spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("warn", LogSink::Info, spdlog::level::warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("error", LogSink::Error, spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("debug", LogSink::Info, spdlog::level::debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  // Program output: stdout, no prefix.
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("print", LogSink::Plain, spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write("print_err", LogSink::PlainErr, spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
  }

  void write(const char* method,
             LogSink sink,
             spdlog::level::level_enum level,
             std::string message);

private:
  bool notify(const LogRecord& record);

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
// Sends message through logger when there is one, straight to the console
// otherwise.
void route(Logger* logger,
           LogSink sink,
           spdlog::level::level_enum level,
           std::string message);
} // namespace detail

// Free helpers for code that may or may not own a Logger.

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogSink::Info, spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogSink::Info, spdlog::level::warn, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogSink::Error, spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogSink::Info, spdlog::level::debug, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogSink::Plain, spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogSink::PlainErr, spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
}
