#pragma once
#include <format>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string_view>

namespace transitperf {

using TextLogger = std::function<void(std::string_view)>;

inline TextLogger OstreamLogger(std::ostream& os) {
  return [&os](std::string_view msg) { os << msg << "\n"; };
}

inline TextLogger NullLogger() {
  return [](std::string_view) {};
}

// Wraps `logger` so that concurrent workers never interleave lines.
inline TextLogger SynchronizedLogger(TextLogger logger) {
  auto mutex = std::make_shared<std::mutex>();
  return [logger = std::move(logger), mutex](std::string_view msg) {
    std::lock_guard<std::mutex> lock(*mutex);
    logger(msg);
  };
}

// Formats and forwards a message to `logger`.
template <typename... Args>
void Log(
    const TextLogger& logger,
    std::format_string<Args...> fmt,
    Args&&... args
) {
  logger(std::format(fmt, std::forward<Args>(args)...));
}

}  // namespace transitperf
