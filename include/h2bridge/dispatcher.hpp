#pragma once

#include "h2bridge/control_handler.hpp"
#include "h2bridge/publish_handler.hpp"
#include "h2bridge/transport.hpp"

#include <boost/asio/io_context.hpp>
#include <kelcoro/task.hpp>

namespace h2bridge {

// runs 'engine' connection loop with control and publish handlers.
// Returns normally if peer closed connection, otherwise throws connection_error:
//  * PROTOCOL if engine reports protocol violation
//  * NETWORK on io errors
//  * TIMEOUT if nothing received during options.idle_timeout
// On end all request bodies are failed with 'connection_closed' and in-flight streams
// awaited at most options.disconnect_timeout
// precondition: con && cfg && cfg->service
dd::task<void> serve_connection(boost::asio::io_context&, transport_engine_i& engine, any_connection_t con,
                                dispatch_config_ptr cfg);

}  // namespace h2bridge
