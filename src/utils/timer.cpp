#include "h2bridge/utils/timer.hpp"

#include "h2bridge/errors.hpp"

#include <boost/asio/steady_timer.hpp>

namespace h2bridge {

struct periodic_timer::state {
  boost::asio::steady_timer timer;
  move_only_fn_soos<void()> on_tick;
  duration_t period{};
  // incremented on each start / stop, stale waits see other generation
  size_t generation = 0;
  bool running = false;

  state(boost::asio::io_context& io, move_only_fn_soos<void()> fn) : timer(io), on_tick(std::move(fn)) {
  }
};

static void schedule_tick(const std::shared_ptr<periodic_timer::state>& s) {
  s->timer.expires_after(s->period);
  s->timer.async_wait(
      [w = std::weak_ptr(s), gen = s->generation](const io_error_code& ec) {
        std::shared_ptr<periodic_timer::state> st = w.lock();
        if (ec || !st || !st->running || st->generation != gen)
          return;
        st->on_tick();
        if (st->running && st->generation == gen)
          schedule_tick(st);
      });
}

periodic_timer::periodic_timer(boost::asio::io_context& io, move_only_fn_soos<void()> on_tick)
    : m_state(std::make_shared<state>(io, std::move(on_tick))) {
}

periodic_timer::~periodic_timer() {
  stop();
}

void periodic_timer::start(duration_t period) {
  stop();
  m_state->period = period;
  m_state->running = true;
  schedule_tick(m_state);
}

void periodic_timer::stop() noexcept {
  if (!m_state->running)
    return;
  m_state->running = false;
  ++m_state->generation;
  m_state->timer.cancel();
}

}  // namespace h2bridge
