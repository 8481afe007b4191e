#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

namespace h2bridge {

using byte_t = unsigned char;
using bytes_t = std::vector<byte_t>;

template <typename T, size_t E>
std::span<const byte_t> reinterpret_span_as_bytes(std::span<const T, E> t) {
  static_assert(std::is_same_v<T, char> || std::is_same_v<T, unsigned char> || std::is_same_v<T, std::byte>);

  return std::span<const byte_t, E>(reinterpret_cast<const byte_t*>(t.data()), t.size());
}

inline std::span<const byte_t> as_bytes(std::string_view s) noexcept {
  return reinterpret_span_as_bytes(std::span<const char>(s.data(), s.size()));
}

inline std::string_view as_strview(std::span<const byte_t> b) noexcept {
  return std::string_view(reinterpret_cast<const char*>(b.data()), b.size());
}

}  // namespace h2bridge
