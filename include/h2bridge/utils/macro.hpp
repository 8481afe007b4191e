#pragma once

#include <cassert>

#include <kelcoro/noexport/macro.hpp>
#include <zal/zal.hpp>

namespace h2bridge {

[[noreturn]] inline void unreachable() noexcept {
  assert(false);
  KELCORO_UNREACHABLE;
}

}  // namespace h2bridge
