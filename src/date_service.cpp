#include "h2bridge/date_service.hpp"

#include <format>

namespace h2bridge {

std::string_view date_service::date() {
  return date(clock_type::now());
}

std::string_view date_service::date(clock_type::time_point now) {
  auto sec = std::chrono::floor<std::chrono::seconds>(now);
  if (m_cached.empty() || sec != m_cached_second) {
    m_cached_second = sec;
    m_cached = format_date(sec);
  }
  return m_cached;
}

std::string date_service::format_date(clock_type::time_point tp) {
  return std::format("{:%a, %d %b %Y %H:%M:%S} GMT", std::chrono::floor<std::chrono::seconds>(tp));
}

}  // namespace h2bridge
