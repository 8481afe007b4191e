#include "h2bridge/utils/unique_name.hpp"

#include <atomic>
#include <cstdint>

namespace h2bridge {

static std::atomic<uint32_t> name_counter = 0;

unique_name::unique_name(char prefix) {
  // wraps after million names, still enough to tell apart live connections
  uint32_t n = name_counter.fetch_add(1, std::memory_order_relaxed) % 1'000'000;
  m_str[0] = '[';
  m_str[1] = prefix;
  m_str[2] = '#';
  for (size_t i = LEN - 2; i > 2; --i) {
    m_str[i] = char('0' + n % 10);
    n /= 10;
  }
  m_str[LEN - 1] = ']';
}

}  // namespace h2bridge
