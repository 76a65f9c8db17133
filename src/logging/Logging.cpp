// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>

#include <unistd.h>

namespace sc {

namespace {
constexpr const char* kLevelEnvironmentVariable = "SEGCLIP_LOG_LEVEL";

auto levelToChar(Log::Level level) -> char {
  switch (level) {
  case Log::Level::Debug:
    return 'D';
  case Log::Level::Error:
    return 'E';
  case Log::Level::Info:
    return 'I';
  case Log::Level::Warning:
    return 'W';
  }
  return 'U';
}

void write_record(Log::Level level, const std::source_location& location,
                  const std::string& message) {
  std::filesystem::path file = location.file_name();
  std::string file_name = file.filename();
  int pid = ::getpid();
  int tid = ::gettid();
  std::fprintf(stderr, "[%s:%u] %c %d-%d %s\n", file_name.c_str(), location.line(),
               levelToChar(level), pid, tid, message.c_str());
}

auto initial_level() -> Log::Level {
  const char* value = std::getenv(kLevelEnvironmentVariable);
  if (value == nullptr) {
    return Log::Level::Info;
  }
  if (auto parsed = Log::parse_level(value)) {
    return *parsed;
  }
  write_record(Log::Level::Warning, std::source_location::current(),
               std::format("Ignoring unknown {} value '{}'", kLevelEnvironmentVariable, value));
  return Log::Level::Info;
}

auto threshold() -> std::atomic<Log::Level>& {
  static std::atomic<Log::Level> current{initial_level()};
  return current;
}
} // namespace

auto Log::level() noexcept -> Level { return threshold().load(std::memory_order_relaxed); }

void Log::set_level(Level level) noexcept {
  threshold().store(level, std::memory_order_relaxed);
}

auto Log::enabled(Level level) noexcept -> bool {
  return static_cast<int>(level) >= static_cast<int>(Log::level());
}

auto Log::parse_level(std::string_view name) noexcept -> std::optional<Level> {
  auto equals = [name](std::string_view candidate) {
    return std::ranges::equal(name, candidate, [](char lhs, char rhs) {
      return std::tolower(static_cast<unsigned char>(lhs)) == rhs;
    });
  };
  if (equals("debug")) {
    return Level::Debug;
  }
  if (equals("info")) {
    return Level::Info;
  }
  if (equals("warning") || equals("warn")) {
    return Level::Warning;
  }
  if (equals("error")) {
    return Level::Error;
  }
  return std::nullopt;
}

void Log::vlog(Level level, const std::source_location& location, std::string_view fmt,
               std::format_args args) {
  write_record(level, location, std::vformat(fmt, args));
}

} // namespace sc
