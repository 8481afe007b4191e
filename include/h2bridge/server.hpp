#pragma once

#include "h2bridge/acceptor.hpp"
#include "h2bridge/publish_handler.hpp"
#include "h2bridge/service.hpp"
#include "h2bridge/transport.hpp"

#include <memory>

#include <boost/asio/io_context.hpp>
#include <kelcoro/task.hpp>

namespace h2bridge {

struct server_endpoint {
  internet_address addr;
  bool reuse_address = true;
};

struct server_options {
  transport_options transport;
};

// creates engine for each accepted connection
using engine_factory_t = move_only_fn_soos<transport_engine_ptr()>;

// single threaded server, accepts connections, passes them through acceptor pipeline
// and serves each of them by transport engine with service
struct h2_server {
 private:
  struct impl;
  std::unique_ptr<impl> m_impl;

 public:
  // precondition: engine_factory && service && pipeline.first
  h2_server(engine_factory_t engine_factory, http_service_ptr service, acceptor_pipeline pipeline,
            server_options = {});

  h2_server(h2_server&&) = delete;
  void operator=(h2_server&&) = delete;

  ~h2_server();

  // accepted connections not yet closed, including ones in acceptor pipeline
  [[nodiscard]] size_t sessions_count() const noexcept;

  // returns bound address (with real port if 0 requested)
  internet_address listen(server_endpoint);

  // shutdown server softly, stops accepting and waits until all sessions done
  dd::task<void> shutdown();
  // stops accepting and closes all connections, in-flight streams are abandoned after disconnect timeout
  dd::task<void> terminate();

  // used to run server tasks
  asio::io_context& ioctx();

  void request_stop();
  // similar to ioctx().run()
  void run();
};

}  // namespace h2bridge
