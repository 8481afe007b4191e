#include "h2bridge/headers/caching.hpp"

#include <array>
#include <charconv>

namespace h2bridge {

age age::from_date(std::chrono::steady_clock::time_point date) noexcept {
  auto now = std::chrono::steady_clock::now();
  if (date >= now)
    return age();
  return age(std::chrono::floor<seconds>(now - date));
}

void age::set(seconds value) {
  if (value < seconds(0))
    throw invalid_header_value(name(), std::to_string(value.count()));
  m_value = value;
}

static constexpr bool is_ows(char c) noexcept {
  return c == ' ' || c == '\t';
}

age age::parse(std::string_view value) {
  std::string_view v = value;
  while (!v.empty() && is_ows(v.front()))
    v.remove_prefix(1);
  while (!v.empty() && is_ows(v.back()))
    v.remove_suffix(1);
  // from_chars accepts '-' for signed types, only digits allowed
  if (v.empty() || v.front() < '0' || v.front() > '9')
    throw invalid_header_value(name(), value);
  uint64_t secs = 0;
  auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), secs);
  if (ec != std::errc{} || ptr != v.data() + v.size() || secs > uint64_t(seconds::max().count()))
    throw invalid_header_value(name(), value);
  return age(seconds(secs));
}

std::string age::build() const {
  return std::to_string(m_value.count());
}

auto cache_control::checked_time(seconds v) -> seconds {
  if (v < seconds(0))
    throw invalid_header_value(name(), std::to_string(v.count()));
  return v;
}

bool cache_control::has_flag(cache_flag_e f) const noexcept {
  if (f == cache_flag_e::EMPTY)
    return m_flags == f;
  return (uint16_t(m_flags) & uint16_t(f)) == uint16_t(f);
}

// index of name is bit number of flag
static constexpr std::array<std::string_view, 10> flag_names = {
    "no-cache",        "must-revalidate", "proxy-revalidate", "no-store",  "private",
    "public",          "must-understand", "no-transform",     "immutable", "only-if-cached",
};

std::vector<std::string> cache_control::build() const {
  using directive_t = std::pair<std::string_view, std::optional<seconds> cache_control::*>;
  // ordered by priority, only first setted is sent
  static constexpr directive_t time_directives[] = {
      {"max-age", &cache_control::m_max_age},
      {"s-maxage", &cache_control::m_s_maxage},
      {"stale-while-revalidate", &cache_control::m_stale_while_revalidate},
      {"stale-if-error", &cache_control::m_stale_if_error},
      {"max-stale", &cache_control::m_max_stale},
      {"min-fresh", &cache_control::m_min_fresh},
  };

  std::vector<std::string> values;
  for (size_t i = 0; i < flag_names.size(); ++i) {
    if (has_flag(cache_flag_e(1 << i)))
      values.emplace_back(flag_names[i]);
  }
  for (auto& [dname, member] : time_directives) {
    if (const std::optional<seconds>& v = this->*member) {
      values.push_back(std::format("{}={}", dname, v->count()));
      break;
    }
  }
  return values;
}

std::string cache_control::to_string() const {
  std::string result;
  for (const std::string& v : build()) {
    if (!result.empty())
      result += ", ";
    result += v;
  }
  return result;
}

}  // namespace h2bridge
