#include "h2bridge/control_handler.hpp"

#include "h2bridge/logger.hpp"

namespace h2bridge {

std::string_view e2str(control_result::kind_e k) noexcept {
  switch (k) {
    case control_result::PING_ACK:
      return "PING_ACK";
    case control_result::SETTINGS_ACK:
      return "SETTINGS_ACK";
    case control_result::GOAWAY:
      return "GOAWAY";
    case control_result::DISCONNECT:
      return "DISCONNECT";
  }
  return "UNKNOWN";
}

control_result control_message::ack() const noexcept {
  struct visitor {
    control_result operator()(const ping_message& m) const noexcept {
      return control_result{.kind = control_result::PING_ACK, .ping_data = m.opaque_data};
    }
    control_result operator()(const settings_message&) const noexcept {
      return control_result{.kind = control_result::SETTINGS_ACK};
    }
    control_result operator()(const goaway_message&) const noexcept {
      return control_result{.kind = control_result::DISCONNECT};
    }
    control_result operator()(const protocol_error_message& m) const noexcept {
      return control_result{.kind = control_result::GOAWAY, .errc = m.errc};
    }
    control_result operator()(const peer_gone_message&) const noexcept {
      return control_result{.kind = control_result::DISCONNECT};
    }
  };
  return std::visit(visitor{}, kind);
}

control_result control_handler::handle(control_message msg) {
  if (auto* e = std::get_if<protocol_error_message>(&msg.kind)) {
    H2BRIDGE_LOG_WARN("connection protocol error: {}, errc: {}", e->reason, e2str(e->errc));
  } else if (auto* g = std::get_if<peer_gone_message>(&msg.kind)) {
    H2BRIDGE_LOG_DEBUG("peer gone: {}", g->reason);
  } else if (auto* ga = std::get_if<goaway_message>(&msg.kind)) {
    H2BRIDGE_LOG_DEBUG("GOAWAY received, errc: {}, last stream: {}, debug data: \"{}\"", e2str(ga->errc),
                       ga->last_stream_id, ga->debug_data);
  }
  control_result r = msg.ack();
  H2BRIDGE_LOG_TRACE("control message acknowledged with {}", e2str(r.kind));
  return r;
}

}  // namespace h2bridge
