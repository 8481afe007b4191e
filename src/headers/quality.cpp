#include "h2bridge/headers/quality.hpp"

#include <cmath>
#include <format>

namespace h2bridge {

std::optional<quality> quality::from(double q) noexcept {
  // also rejects NaN
  if (!(q >= 0.0 && q <= 1.0))
    return std::nullopt;
  return quality(uint16_t(std::lround(q * max_value)));
}

std::string quality::to_string() const {
  if (!m_value)
    return {};
  uint16_t v = *m_value;
  if (v % max_value == 0)
    return std::format("q={}", v / max_value);
  // 3 digits of fraction without trailing zeros
  uint16_t frac = v % max_value;
  int digits = 3;
  while (frac % 10 == 0) {
    frac /= 10;
    --digits;
  }
  return std::format("q={}.{:0{}}", v / max_value, frac, digits);
}

}  // namespace h2bridge
