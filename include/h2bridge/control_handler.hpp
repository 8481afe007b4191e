#pragma once

#include "h2bridge/transport.hpp"

namespace h2bridge {

// acknowledges every control message with its default reaction, always ready
struct control_handler final : control_service_i {
  control_result handle(control_message) override;
};

}  // namespace h2bridge
