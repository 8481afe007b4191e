#pragma once

#include <format>
#include <string_view>

namespace h2bridge {

constexpr inline char SERVER_PREFIX = 'S';
constexpr inline char CONNECTION_PREFIX = 'c';

// log name of server or connection, e.g. "[c#000017]".
// Number is unique within process, so all lines of one connection can be grepped
struct unique_name {
 private:
  static constexpr size_t LEN = 10;

  char m_str[LEN];

 public:
  explicit unique_name(char prefix = '-');

  [[nodiscard]] char prefix() const noexcept {
    return m_str[1];
  }

  std::string_view str() const noexcept {
    return std::string_view(+m_str, LEN);
  }
};

}  // namespace h2bridge

namespace std {

template <>
struct formatter<::h2bridge::unique_name> : formatter<string_view> {
  auto format(::h2bridge::unique_name const& n, auto& ctx) const -> decltype(ctx.out()) {
    return formatter<string_view>::format(n.str(), ctx);
  }
};

}  // namespace std
