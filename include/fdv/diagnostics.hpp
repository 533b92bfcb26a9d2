#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fdv {

enum class LogLevel {
  Info,
  Warn,
  Error,
};

const char* log_level_name(LogLevel level);

struct LogEvent {
  LogLevel level{LogLevel::Info};
  std::string message;
  uint64_t sequence_number{0};  // 1-based, unique, strictly increasing
};

struct DiagnosticsOptions {
  // Mirror warn/error events to std::cerr ("Warning: ..." / "Error: ...").
  bool echo_to_stderr{false};
  // Also mirror info events (printed without a prefix).
  bool echo_info{false};
};

namespace detail {
struct DiagnosticsState;
} // namespace detail

// Live cursor over a DiagnosticsChannel.
//
// A subscription only observes events appended after it was created, in
// sequence order. It cannot be rewound. Copies share nothing but the channel:
// each copy advances its own cursor.
class Subscription {
public:
  // Wait up to timeout for the next event.
  std::optional<LogEvent> next(std::chrono::milliseconds timeout);

  // Return the next event if one is already available.
  std::optional<LogEvent> try_next();

  // Sequence number of the last event delivered (or the start point).
  uint64_t cursor() const { return cursor_; }

private:
  friend class DiagnosticsChannel;
  Subscription(std::shared_ptr<detail::DiagnosticsState> state, uint64_t start)
    : state_(std::move(state)), cursor_(start) {}

  std::shared_ptr<detail::DiagnosticsState> state_;
  uint64_t cursor_{0};
};

// Append-only, thread-safe event log shared by all engine components.
//
// Appends are serialized by a single mutex; each gets the next sequence
// number. Consumers either pull the full history with drain() or follow new
// events through subscribe(). Readers never hold the lock while waiting, so
// they cannot stall producers.
class DiagnosticsChannel {
public:
  explicit DiagnosticsChannel(DiagnosticsOptions opts = DiagnosticsOptions());

  uint64_t append(LogLevel level, const std::string& message);

  uint64_t info(const std::string& message) { return append(LogLevel::Info, message); }
  uint64_t warn(const std::string& message) { return append(LogLevel::Warn, message); }
  uint64_t error(const std::string& message) { return append(LogLevel::Error, message); }

  // All events since the channel was created, in sequence order.
  std::vector<LogEvent> drain() const;

  // Events with sequence_number > after.
  std::vector<LogEvent> drain_since(uint64_t after) const;

  Subscription subscribe();

  size_t size() const;

  void set_echo(bool echo_to_stderr, bool echo_info);

private:
  std::shared_ptr<detail::DiagnosticsState> state_;
};

// Null-tolerant helpers for components that take an optional channel.
inline void log_info(DiagnosticsChannel* d, const std::string& msg) {
  if (d) d->info(msg);
}
inline void log_warn(DiagnosticsChannel* d, const std::string& msg) {
  if (d) d->warn(msg);
}
inline void log_error(DiagnosticsChannel* d, const std::string& msg) {
  if (d) d->error(msg);
}

} // namespace fdv
