#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace h2bridge {

// weight parameter of content negotiation headers (accept, accept-encoding...), "q=0.5"
// stored as thousandths, [0, 1000]
struct quality {
 private:
  // nullopt means default weight (1), which is not sent
  std::optional<uint16_t> m_value;

  constexpr explicit quality(uint16_t v) noexcept : m_value(v) {
  }

 public:
  static constexpr uint16_t max_value = 1000;

  // most preferred (default)
  constexpr quality() = default;

  // returns nullopt if 'q' not in [0, 1]
  // precision is 3 decimal digits
  static std::optional<quality> from(double q) noexcept;

  static constexpr quality most_preferred() noexcept {
    return quality();
  }
  // 0.001
  static constexpr quality least_preferred() noexcept {
    return quality(1);
  }
  // 0
  static constexpr quality not_acceptable() noexcept {
    return quality(0);
  }

  [[nodiscard]] constexpr bool is_default() const noexcept {
    return !m_value.has_value();
  }
  // thousandths
  [[nodiscard]] constexpr uint16_t value() const noexcept {
    return m_value.value_or(max_value);
  }

  // "" for default, otherwise "q=<value>" without trailing zeros
  [[nodiscard]] std::string to_string() const;

  bool operator==(const quality&) const = default;
};

}  // namespace h2bridge
