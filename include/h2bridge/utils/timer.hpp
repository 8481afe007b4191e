#pragma once

#include "h2bridge/utils/deadline.hpp"
#include "h2bridge/utils/fn_ref.hpp"

#include <memory>

#include <boost/asio/io_context.hpp>

namespace h2bridge {

// invokes 'on_tick' every period until stopped or destroyed.
// Single threaded: callback, start and stop run on the io_context thread
struct periodic_timer {
  struct state;

 private:
  std::shared_ptr<state> m_state;

 public:
  periodic_timer(boost::asio::io_context&, move_only_fn_soos<void()> on_tick);

  periodic_timer(periodic_timer&&) = delete;
  void operator=(periodic_timer&&) = delete;

  ~periodic_timer();

  // restarts if already running
  void start(duration_t period);
  // tick already queued by asio is not invoked after stop
  void stop() noexcept;
};

}  // namespace h2bridge
