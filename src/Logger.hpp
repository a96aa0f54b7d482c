#pragma once

#include <atomic>
#include <cstdio>  // for fileno()
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unistd.h>  // for isatty()

namespace logr {

enum class Level { Debug = 0, Info, Warning, Error, None };

inline std::optional<Level> ParseLevel(const std::string& s) {
  if (s == "debug" || s == "1")
    return Level::Debug;
  if (s == "info" || s == "2")
    return Level::Info;
  if (s == "warning" || s == "3")
    return Level::Warning;
  if (s == "error" || s == "4")
    return Level::Error;
  if (s == "none" || s == "off")
    return Level::None;
  return std::nullopt;
}

// Level from ~/.pagelift/logging.json ({"level": "debug"}), overridden by the
// PAGELIFT_LOG environment variable.
inline Level ConfiguredLevel() {
  Level base = Level::Info;
  if (auto* home = std::getenv("HOME")) {
    std::ifstream in{std::string(home) + "/.pagelift/logging.json"};
    if (in) {
      auto j = nlohmann::json::parse(in, nullptr, false);
      if (!j.is_discarded()) {
        if (auto it = j.find("level"); it != j.end() && it->is_string()) {
          if (auto lvl = ParseLevel(it->get<std::string>()))
            base = *lvl;
        }
      }
    }
  }
  if (auto* env = std::getenv("PAGELIFT_LOG")) {
    if (auto lvl = ParseLevel(env))
      base = *lvl;
  }
  return base;
}

inline std::atomic<Level>& LevelSlot() {
  static std::atomic<Level> lvl{ConfiguredLevel()};
  return lvl;
}

inline Level CurrentLevel() {
  return LevelSlot().load(std::memory_order_relaxed);
}

// CLI --verbose / --quiet and tests lower or raise the threshold at runtime.
inline void SetLevel(Level lvl) {
  LevelSlot().store(lvl, std::memory_order_relaxed);
}

// returns true if a message at level `msg` should be suppressed
inline bool ShouldMute(Level msg) {
  if (msg == Level::None)
    return true;
  return static_cast<int>(msg) < static_cast<int>(CurrentLevel());
}

inline bool is_tty() {
  return ::isatty(::fileno(stderr)) != 0;
}

// ANSI escape sequences
static constexpr char const* RESET = "\033[0m";
static constexpr char const* CYAN = "\033[36m";
static constexpr char const* GREEN = "\033[32m";
static constexpr char const* YELLOW = "\033[33m";
static constexpr char const* RED = "\033[31m";

inline constexpr char const* colorCode(Level L) {
  switch (L) {
    case Level::Debug:
      return CYAN;
    case Level::Info:
      return GREEN;
    case Level::Warning:
      return YELLOW;
    case Level::Error:
      return RED;
    default:
      return RESET;
  }
}

// RAII proxy: colour prefix in ctor, reset + newline in dtor. Holds the log
// mutex for its lifetime so fetch workers never interleave lines.
class LogEntry {
 public:
  LogEntry(Level L) : lvl(L), muted(ShouldMute(L)) {
    if (!muted) {
      lock = std::unique_lock<std::mutex>(log_mutex());
      if (is_tty()) {
        std::cerr << colorCode(lvl);
      }
    }
  }

  ~LogEntry() {
    if (!muted && lock.owns_lock()) {
      if (is_tty()) {
        std::cerr << RESET;
      }
      std::cerr << std::endl;
    }
  }

  LogEntry(LogEntry&&) noexcept = default;
  LogEntry& operator=(LogEntry&&) noexcept = default;

  LogEntry(const LogEntry&) = delete;
  LogEntry& operator=(const LogEntry&) = delete;

  template <typename T>
  LogEntry& operator<<(T const& v) {
    if (!muted) {
      std::cerr << v;
    }
    return *this;
  }

  LogEntry& operator<<(std::ostream& (*m)(std::ostream&)) {
    if (!muted) {
      m(std::cerr);
    }
    return *this;
  }

 private:
  Level lvl;
  bool muted;
  std::unique_lock<std::mutex> lock;

  static std::mutex& log_mutex() {
    static std::mutex m;
    return m;
  }
};

struct Logger {
  Level lvl;
  constexpr Logger(Level L) : lvl(L) {
  }

  // first << on a Logger opens a LogEntry
  template <typename T>
  LogEntry operator<<(T const& v) const {
    LogEntry e(lvl);
    e << v;
    return e;
  }

  LogEntry operator<<(std::ostream& (*m)(std::ostream&)) const {
    LogEntry e(lvl);
    e << m;
    return e;
  }
};

inline constexpr Logger debug{Level::Debug};
inline constexpr Logger info{Level::Info};
inline constexpr Logger warning{Level::Warning};
inline constexpr Logger error{Level::Error};
}  // namespace logr

// Guard expensive log payloads:
//   IF_DEBUG {
//     logr::debug << "graph: " << graph.Dump();
//   }
#define IF_DEBUG if (logr::CurrentLevel() <= logr::Level::Debug)
#define IF_INFO if (logr::CurrentLevel() <= logr::Level::Info)
#define IF_WARNING if (logr::CurrentLevel() <= logr::Level::Warning)
#define IF_ERROR if (logr::CurrentLevel() <= logr::Level::Error)
