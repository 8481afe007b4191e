#include "h2bridge/dispatcher.hpp"

#include "h2bridge/logger.hpp"
#include "h2bridge/utils/timer.hpp"

#include <algorithm>
#include <cassert>
#include <optional>

#include <zal/zal.hpp>

namespace h2bridge {

namespace {

// counts events to detect idle connection

struct counting_control final : control_service_i {
  control_service_i& next;
  size_t& counter;

  counting_control(control_service_i& n, size_t& c) noexcept : next(n), counter(c) {
  }

  control_result handle(control_message msg) override {
    ++counter;
    return next.handle(std::move(msg));
  }
};

struct counting_publish final : publish_service_i {
  publish_service_i& next;
  size_t& counter;

  counting_publish(publish_service_i& n, size_t& c) noexcept : next(n), counter(c) {
  }

  void handle(stream_message msg) override {
    ++counter;
    next.handle(std::move(msg));
  }
};

}  // namespace

// how often idle timer checks activity
static duration_t idle_check_period(duration_t idle_timeout) noexcept {
  return std::clamp<duration_t>(idle_timeout / 4, std::chrono::milliseconds(1), std::chrono::milliseconds(100));
}

dd::task<void> serve_connection(boost::asio::io_context& io, transport_engine_i& engine, any_connection_t con,
                                dispatch_config_ptr cfg) {
  assert(con && cfg && cfg->service);
  unique_name name(CONNECTION_PREFIX);
  H2BRIDGE_LOG(DEBUG, "serving connection from {}, secure: {}", con->remote_address(), con->is_secure(), name);

  control_handler control;
  publish_handler_ptr publish = new publish_handler(cfg, con->is_secure(), name);
  size_t activity = 0;
  counting_control counted_control(control, activity);
  counting_publish counted_publish(*publish, activity);

  bool idle_expired = false;
  periodic_timer idle_timer(io, [&, last_activity = size_t(0), last_change = std::chrono::steady_clock::now()]() mutable {
    auto now = std::chrono::steady_clock::now();
    if (activity != last_activity) {
      last_activity = activity;
      last_change = now;
      return;
    }
    // nothing happens since last check
    // Note: long request handling without client frames considered as idle,
    // client expected to send PING if nothing happens
    if (now - last_change < cfg->options.idle_timeout || idle_expired)
      return;
    H2BRIDGE_LOG(DEBUG, "drops connection due client inactivity", name);
    idle_expired = true;
    con->shutdown();
  });
  idle_timer.start(idle_check_period(cfg->options.idle_timeout));

  std::optional<connection_error> err;
  try {
    co_await engine.serve(*con, counted_control, counted_publish, cfg->options);
  } catch (protocol_error& e) {
    err.emplace(connection_error::PROTOCOL, e.what());
  } catch (network_exception& e) {
    err.emplace(connection_error::NETWORK, e.what());
  } catch (timeout_exception& e) {
    err.emplace(connection_error::TIMEOUT, e.what());
  } catch (std::exception& e) {
    H2BRIDGE_LOG(ERROR, "transport engine failed: {}", e.what(), name);
    err.emplace(connection_error::NETWORK, e.what());
  }
  idle_timer.stop();
  if (idle_expired)
    err.emplace(connection_error::TIMEOUT, "client inactivity");

  con->shutdown();
  co_await publish->terminate(io);

  if (err) {
    H2BRIDGE_LOG(DEBUG, "connection ended with error: {}", err->what(), name);
    throw std::move(*err);
  }
  H2BRIDGE_LOG(DEBUG, "connection closed by peer", name);
}

}  // namespace h2bridge
