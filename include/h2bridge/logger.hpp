#pragma once

#include <format>
#include <iostream>
#include <iterator>
#include <mutex>
#include <string>
#include <string_view>

namespace h2bridge {

enum struct log_level_e { error, warn, info, debug, trace };

constexpr std::string_view log_prefix(log_level_e l) noexcept {
  switch (l) {
    case log_level_e::error:
      return "[ERROR][H2BRIDGE] ";
    case log_level_e::warn:
      return "[WARN][H2BRIDGE] ";
    case log_level_e::info:
      return "[INFO][H2BRIDGE] ";
    case log_level_e::debug:
      return "[DEBUG][H2BRIDGE] ";
    case log_level_e::trace:
      return "[TRACE][H2BRIDGE] ";
  }
  return "[H2BRIDGE] ";
}

// connections of one server log from different threads, line is written at once
template <typename... Args>
void log_line(log_level_e l, std::format_string<Args...> fmt, Args&&... args) {
  std::string line(log_prefix(l));
  std::format_to(std::back_inserter(line), fmt, std::forward<Args>(args)...);
  line.push_back('\n');
  static std::mutex mtx;
  std::lock_guard lock(mtx);
  std::cout << line;
}

}  // namespace h2bridge

#define H2BRIDGE_LOG_INFO(FMT_STR, ...) ::h2bridge::log_line(::h2bridge::log_level_e::info, FMT_STR __VA_OPT__(, ) __VA_ARGS__)
#define H2BRIDGE_LOG_ERROR(FMT_STR, ...) \
  ::h2bridge::log_line(::h2bridge::log_level_e::error, FMT_STR __VA_OPT__(, ) __VA_ARGS__)
#define H2BRIDGE_LOG_WARN(FMT_STR, ...) ::h2bridge::log_line(::h2bridge::log_level_e::warn, FMT_STR __VA_OPT__(, ) __VA_ARGS__)

#ifndef NDEBUG
  #define H2BRIDGE_LOG_DEBUG(FMT_STR, ...) \
    ::h2bridge::log_line(::h2bridge::log_level_e::debug, FMT_STR __VA_OPT__(, ) __VA_ARGS__)
#else
  #define H2BRIDGE_LOG_DEBUG(FMT_STR, ...) (void)0
#endif

#ifdef H2BRIDGE_ENABLE_TRACE
  #define H2BRIDGE_LOG_TRACE(FMT_STR, ...) \
    ::h2bridge::log_line(::h2bridge::log_level_e::trace, FMT_STR __VA_OPT__(, ) __VA_ARGS__)
#else
  #define H2BRIDGE_LOG_TRACE(FMT_STR, ...) (void)0
#endif

// entity name (server or connection) always last argument, appended to message
#define H2BRIDGE_LOG(TYPE, STR, ...) H2BRIDGE_LOG_##TYPE(STR " {}" __VA_OPT__(, ) __VA_ARGS__)
