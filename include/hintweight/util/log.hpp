#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <iterator>
#include <mutex>
#include <string>
#include <string_view>
#include <unistd.h>
#include <utility>

namespace hintweight::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error, Off };

inline constexpr std::array<std::string_view, 6> level_names = {
    "trace", "debug", "info", "warn", "error", "off"};

inline constexpr std::array<std::string_view, 6> level_colors = {
    "\o{33}[90m", // trace: gray
    "\o{33}[36m", // debug: cyan
    "\o{33}[32m", // info: green
    "\o{33}[33m", // warn: yellow
    "\o{33}[31m", // error: red
    "",           // off
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

// Synchronous logger; each line is written whole under write_mutex_.
class Logger {
  std::atomic<Level> level_{Level::Info};
  std::FILE *output_{stderr};
  std::FILE *file_{nullptr};
  bool color_{false};
  std::mutex write_mutex_;

public:
  Logger() : color_(::isatty(::fileno(stderr)) != 0) {}
  ~Logger() {
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() -> void {
    std::lock_guard lock(write_mutex_);
    if (file_) {
      std::fclose(file_);
      file_ = nullptr;
    }
    output_ = stderr;
    color_ = ::isatty(::fileno(stderr)) != 0;
  }

  auto set_output_file(std::string_view path) -> bool {
    std::FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f)
      return false;
    std::setvbuf(f, nullptr, _IOLBF, 0);
    std::lock_guard lock(write_mutex_);
    if (file_)
      std::fclose(file_);
    file_ = f;
    output_ = f;
    color_ = false;
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire) || level == Level::Off)
      return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);

    std::string line;
    line.reserve(128);
    std::lock_guard lock(write_mutex_);
    if (color_) {
      std::format_to(std::back_inserter(line),
                     "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] ", time,
                     level_color(level), level_name(level), "\o{33}[0m");
    } else {
      std::format_to(std::back_inserter(line), "[{:%Y-%m-%d %H:%M:%S}] [{}] ",
                     time, level_name(level));
    }
    std::format_to(std::back_inserter(line), fmt, std::forward<Args>(args)...);
    line.push_back('\n');
    std::fwrite(line.data(), 1, line.size(), output_);
    std::fflush(output_);
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

// Unknown names fall back to info.
inline auto set_level(std::string_view name) noexcept -> void {
  const auto *it = std::ranges::find(level_names, name);
  auto level = (it != level_names.end())
                   ? static_cast<Level>(std::distance(level_names.begin(), it))
                   : Level::Info;
  logger().set_level(level);
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace hintweight::log
