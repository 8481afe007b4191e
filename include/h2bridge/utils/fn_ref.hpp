#pragma once

#include <anyany/anyany.hpp>

namespace h2bridge {

// move only with SooS == 0 for less sizeof (stored per stream and per credit)
template <typename Signature>
using move_only_fn = aa::basic_any_with<aa::default_allocator, 0, aa::call<Signature>>;

// with default small object optimization, used where callables are stored once per connection
template <typename Signature>
using move_only_fn_soos = aa::any_with<aa::call<Signature>, aa::move>;

}  // namespace h2bridge
