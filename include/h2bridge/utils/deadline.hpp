#pragma once

#include <chrono>

namespace h2bridge {

using duration_t = std::chrono::steady_clock::duration;

// moment after which waiting (graceful disconnect, handshake) stops
struct deadline_t {
  std::chrono::steady_clock::time_point tp;

  [[nodiscard]] bool reached() const noexcept {
    return tp <= std::chrono::steady_clock::now();
  }
};

// non-positive timeout gives already reached deadline, too big one saturates
inline deadline_t deadline_after(duration_t timeout) noexcept {
  using tp_t = std::chrono::steady_clock::time_point;
  if (timeout <= duration_t::zero())
    return deadline_t{tp_t::min()};
  auto now = std::chrono::steady_clock::now();
  if (tp_t::max() - now <= timeout)
    return deadline_t{tp_t::max()};
  return deadline_t{now + timeout};
}

}  // namespace h2bridge
