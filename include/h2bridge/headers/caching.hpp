#pragma once

#include "h2bridge/headers/header_value.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace h2bridge {

// "age" header, time in seconds since response was generated on origin server
struct age {
  using seconds = std::chrono::seconds;

 private:
  seconds m_value = seconds(0);

 public:
  constexpr age() = default;
  // throws invalid_header_value if value < 0
  explicit age(seconds value) {
    set(value);
  }

  // response generated now
  static constexpr age from_origin() noexcept {
    return age();
  }
  // time passed since 'date', zero if 'date' is in future
  static age from_date(std::chrono::steady_clock::time_point date) noexcept;

  // throws invalid_header_value if value is not non-negative integer
  static age parse(std::string_view value);

  [[nodiscard]] constexpr seconds get() const noexcept {
    return m_value;
  }
  // throws invalid_header_value if value < 0
  void set(seconds value);

  static constexpr std::string_view name() noexcept {
    return "age";
  }
  [[nodiscard]] std::string build() const;

  bool operator==(const age&) const = default;
};

enum struct cache_flag_e : uint16_t {
  EMPTY = 0,
  NO_CACHE = 1,
  MUST_REVALIDATE = 1 << 1,
  PROXY_REVALIDATE = 1 << 2,
  NO_STORE = 1 << 3,
  PRIVATE = 1 << 4,
  PUBLIC = 1 << 5,
  MUST_UNDERSTAND = 1 << 6,
  NO_TRANSFORM = 1 << 7,
  IMMUTABLE = 1 << 8,
  ONLY_IF_CACHED = 1 << 9,
};

constexpr cache_flag_e operator|(cache_flag_e a, cache_flag_e b) noexcept {
  return cache_flag_e(uint16_t(a) | uint16_t(b));
}

// "cache-control" header: flags and at most one time directive.
// If many time directives setted, only one with highest priority is sent:
// max-age > s-maxage > stale-while-revalidate > stale-if-error > max-stale > min-fresh
struct cache_control {
  using seconds = std::chrono::seconds;

 private:
  cache_flag_e m_flags = cache_flag_e::EMPTY;
  std::optional<seconds> m_max_age;
  std::optional<seconds> m_s_maxage;
  std::optional<seconds> m_stale_while_revalidate;
  std::optional<seconds> m_stale_if_error;
  std::optional<seconds> m_max_stale;
  std::optional<seconds> m_min_fresh;

  // throws invalid_header_value if v < 0
  static seconds checked_time(seconds v);

 public:
  // for EMPTY returns true only if no one flag setted
  // for combination of flags returns true if all of them setted
  [[nodiscard]] bool has_flag(cache_flag_e) const noexcept;
  [[nodiscard]] cache_flag_e flags() const noexcept {
    return m_flags;
  }
  cache_control& set_flag(cache_flag_e f) noexcept {
    m_flags = m_flags | f;
    return *this;
  }
  cache_control& remove_flag(cache_flag_e f) noexcept {
    m_flags = cache_flag_e(uint16_t(m_flags) & ~uint16_t(f));
    return *this;
  }

  [[nodiscard]] std::optional<seconds> max_age() const noexcept {
    return m_max_age;
  }
  [[nodiscard]] std::optional<seconds> s_maxage() const noexcept {
    return m_s_maxage;
  }
  [[nodiscard]] std::optional<seconds> stale_while_revalidate() const noexcept {
    return m_stale_while_revalidate;
  }
  [[nodiscard]] std::optional<seconds> stale_if_error() const noexcept {
    return m_stale_if_error;
  }
  [[nodiscard]] std::optional<seconds> max_stale() const noexcept {
    return m_max_stale;
  }
  [[nodiscard]] std::optional<seconds> min_fresh() const noexcept {
    return m_min_fresh;
  }

  cache_control& set_max_age(seconds v) {
    m_max_age = checked_time(v);
    return *this;
  }
  cache_control& set_s_maxage(seconds v) {
    m_s_maxage = checked_time(v);
    return *this;
  }
  cache_control& set_stale_while_revalidate(seconds v) {
    m_stale_while_revalidate = checked_time(v);
    return *this;
  }
  cache_control& set_stale_if_error(seconds v) {
    m_stale_if_error = checked_time(v);
    return *this;
  }
  cache_control& set_max_stale(seconds v) {
    m_max_stale = checked_time(v);
    return *this;
  }
  cache_control& set_min_fresh(seconds v) {
    m_min_fresh = checked_time(v);
    return *this;
  }

  static constexpr std::string_view name() noexcept {
    return "cache-control";
  }
  // flags in fixed order, then time directive
  [[nodiscard]] std::vector<std::string> build() const;
  // values joined with ", "
  [[nodiscard]] std::string to_string() const;

  bool operator==(const cache_control&) const = default;
};

}  // namespace h2bridge
