#include "fdv/diagnostics.hpp"

#include <cstddef>
#include <iostream>

namespace fdv {

namespace detail {

struct DiagnosticsState {
  mutable std::mutex mu;
  std::condition_variable cv;
  std::vector<LogEvent> events;  // events[k] has sequence_number k + 1
  DiagnosticsOptions opts;
};

} // namespace detail

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Info: return "info";
    case LogLevel::Warn: return "warn";
    case LogLevel::Error: return "error";
  }
  return "info";
}

DiagnosticsChannel::DiagnosticsChannel(DiagnosticsOptions opts)
  : state_(std::make_shared<detail::DiagnosticsState>()) {
  state_->opts = opts;
}

uint64_t DiagnosticsChannel::append(LogLevel level, const std::string& message) {
  uint64_t seq = 0;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    seq = static_cast<uint64_t>(state_->events.size()) + 1;
    state_->events.push_back(LogEvent{level, message, seq});

    // Echo under the lock so console order matches sequence order.
    const DiagnosticsOptions& o = state_->opts;
    if (o.echo_to_stderr) {
      if (level == LogLevel::Warn) {
        std::cerr << "Warning: " << message << "\n";
      } else if (level == LogLevel::Error) {
        std::cerr << "Error: " << message << "\n";
      } else if (o.echo_info) {
        std::cerr << message << "\n";
      }
    }
  }
  state_->cv.notify_all();
  return seq;
}

std::vector<LogEvent> DiagnosticsChannel::drain() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->events;
}

std::vector<LogEvent> DiagnosticsChannel::drain_since(uint64_t after) const {
  std::lock_guard<std::mutex> lock(state_->mu);
  std::vector<LogEvent> out;
  if (after < state_->events.size()) {
    out.assign(state_->events.begin() + static_cast<std::ptrdiff_t>(after), state_->events.end());
  }
  return out;
}

Subscription DiagnosticsChannel::subscribe() {
  std::lock_guard<std::mutex> lock(state_->mu);
  return Subscription(state_, static_cast<uint64_t>(state_->events.size()));
}

size_t DiagnosticsChannel::size() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->events.size();
}

void DiagnosticsChannel::set_echo(bool echo_to_stderr, bool echo_info) {
  std::lock_guard<std::mutex> lock(state_->mu);
  state_->opts.echo_to_stderr = echo_to_stderr;
  state_->opts.echo_info = echo_info;
}

std::optional<LogEvent> Subscription::next(std::chrono::milliseconds timeout) {
  if (!state_) return std::nullopt;
  std::unique_lock<std::mutex> lock(state_->mu);
  const bool ready = state_->cv.wait_for(lock, timeout, [&] {
    return state_->events.size() > cursor_;
  });
  if (!ready) return std::nullopt;
  LogEvent ev = state_->events[static_cast<size_t>(cursor_)];
  ++cursor_;
  return ev;
}

std::optional<LogEvent> Subscription::try_next() {
  if (!state_) return std::nullopt;
  std::lock_guard<std::mutex> lock(state_->mu);
  if (state_->events.size() <= cursor_) return std::nullopt;
  LogEvent ev = state_->events[static_cast<size_t>(cursor_)];
  ++cursor_;
  return ev;
}

} // namespace fdv
