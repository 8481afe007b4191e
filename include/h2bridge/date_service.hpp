#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace h2bridge {

// provides value for 'date' header (IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT")
// formatted value is cached and refreshed only when second changed
// for using in single thread!
struct date_service {
  using clock_type = std::chrono::system_clock;

 private:
  clock_type::time_point m_cached_second = {};
  std::string m_cached;

 public:
  // returned value valid until next call
  [[nodiscard]] std::string_view date();
  [[nodiscard]] std::string_view date(clock_type::time_point now);

  [[nodiscard]] static std::string format_date(clock_type::time_point);
};

}  // namespace h2bridge
