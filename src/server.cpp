#include "h2bridge/server.hpp"

#include "h2bridge/asio/asio_executor.hpp"
#include "h2bridge/asio/awaiters.hpp"
#include "h2bridge/dispatcher.hpp"
#include "h2bridge/logger.hpp"
#include "h2bridge/utils/unique_name.hpp"

#include <cassert>
#include <list>
#include <thread>

#include <boost/asio/ip/tcp.hpp>
#include <boost/intrusive/list.hpp>
#include <kelcoro/gate.hpp>
#include <zal/zal.hpp>

/*

Each listener runs accept loop, each accepted socket gets own connection task:

  socket -> acceptor pipeline (tcp options, tls handshake, ALPN) -> engine from factory -> serve_connection

All connections share one dispatch config (service, date cache, transport options).
Gate counts accept loops and connection tasks, stop closes it and waits them.
Soft stop only closes listeners, connections end on their own (peer GOAWAY or idle timeout),
hard stop also shuts down every established connection, dispatcher then fails open request bodies
and waits in-flight streams at most disconnect timeout

*/

namespace h2bridge {

namespace bi = boost::intrusive;

namespace {

struct listener {
  asio::ip::tcp::acceptor acceptor;
  std::string addr;

  listener(asio::io_context& io, const server_endpoint& e) : acceptor(io, e.addr, e.reuse_address) {
  }
};

// connection known to server from accept until it served
struct connection_slot : bi::list_base_hook<bi::link_mode<bi::safe_link>> {
  // null while pipeline is running
  connection_i* con = nullptr;
};

}  // namespace

struct h2_server::impl {
  // on top bcs of destroy order
  asio::io_context io;
  bi::list<connection_slot> connections;
  std::list<listener> listeners;
  dd::gate gate;
  engine_factory_t engine_factory;
  acceptor_pipeline pipeline;
  dispatch_config_ptr config;
  unique_name name{SERVER_PREFIX};
#ifndef NDEBUG
  std::thread::id tid = std::this_thread::get_id();
#endif

  impl(engine_factory_t ef, http_service_ptr s, acceptor_pipeline p, server_options o)
      : engine_factory(std::move(ef)), pipeline(std::move(p)) {
    auto cfg = std::make_shared<dispatch_config>();
    cfg->service = std::move(s);
    cfg->options = o.transport;
    config = std::move(cfg);
  }

  void assert_thread() const noexcept {
#ifndef NDEBUG
    assert(std::this_thread::get_id() == tid);
#endif
  }

  internet_address listen(const server_endpoint& e) {
    assert_thread();
    listener& l = listeners.emplace_back(io, e);
    auto it = std::prev(listeners.end());
    on_scope_failure(drop) {
      listeners.erase(it);
    };
    l.acceptor.listen();
    internet_address bound = l.acceptor.local_endpoint();
    l.addr = std::format("{}:{}", bound.address().to_string(), bound.port());
    accept_loop(gate.hold(), it).start_and_detach();
    drop.no_longer_needed();
    H2BRIDGE_LOG(INFO, "listening on {}", l.addr, name);
    return bound;
  }

  dd::task<void> accept_loop(dd::gate::holder, std::list<listener>::iterator it) try {
    on_scope_exit {
      H2BRIDGE_LOG(TRACE, "stopped listening on {}", it->addr, name);
      listeners.erase(it);
    };
    while (!gate.is_closed()) {
      io_error_code ec;
      asio::ip::tcp::socket socket(io);
      co_await net.accept(it->acceptor, socket, ec);
      assert_thread();
      if (gate.is_closed())
        co_return;
      if (ec) {
        // accept errors (e.g. too many open files) must not stop listening
        if (ec != asio::error::operation_aborted)
          H2BRIDGE_LOG(ERROR, "accept failed on {}, err: {}", it->addr, ec.message(), name);
        continue;
      }
      connection_task(gate.hold(), std::move(socket)).start_and_detach();
    }
  } catch (std::exception& e) {
    H2BRIDGE_LOG(ERROR, "accept loop on {} failed: {}", it->addr, e.what(), name);
  }

  // failures of one connection are logged and never stop server
  dd::task<void> connection_task(dd::gate::holder, asio::ip::tcp::socket socket) try {
    assert_thread();
    connection_slot slot;
    connections.push_back(slot);
    on_scope_exit {
      connections.erase(connections.iterator_to(slot));
    };

    any_connection_t con;
    try {
      con = co_await pipeline.accept(std::move(socket));
    } catch (connection_error& e) {
      H2BRIDGE_LOG(ERROR, "connection rejected, {}", e.what(), name);
      co_return;
    }
    if (gate.is_closed()) {
      H2BRIDGE_LOG(INFO, "connection established while server is stopping, closed", name);
      con->shutdown();
      co_return;
    }
    slot.con = con.get();

    transport_engine_ptr engine = engine_factory();
    assert(engine);
    try {
      co_await serve_connection(io, *engine, std::move(con), config);
    } catch (connection_error& e) {
      H2BRIDGE_LOG(INFO, "connection closed, {}", e.what(), name);
    }
  } catch (std::exception& e) {
    H2BRIDGE_LOG(ERROR, "connection task failed: {}", e.what(), name);
  }

  // closes listeners, if 'close_connections' also shuts down established connections.
  // Returns when all accept loops and connection tasks are done
  dd::task<void> stop(bool close_connections) {
    co_await jump_on_ioctx(io);
    assert_thread();
    H2BRIDGE_LOG(TRACE, "{} started, listeners: {}, connections: {}", close_connections ? "terminate" : "shutdown",
                 listeners.size(), connections.size(), name);
    auto closed = gate.close();
    if (close_connections) {
      for (connection_slot& s : connections) {
        if (s.con)
          s.con->shutdown();
      }
    }
    for (listener& l : listeners) {
      io_error_code ec;
      l.acceptor.close(ec);
    }
    co_await closed;
    co_await yield_on_ioctx(io);
    // server may listen again after stop
    if (gate.is_closed())
      gate.reopen();
    assert(connections.empty());
    assert(listeners.empty());
    H2BRIDGE_LOG(TRACE, "stopped", name);
  }
};

h2_server::h2_server(engine_factory_t engine_factory, http_service_ptr service, acceptor_pipeline pipeline,
                     server_options options)
    : m_impl(std::make_unique<impl>(std::move(engine_factory), std::move(service), std::move(pipeline),
                                    std::move(options))) {
  assert(m_impl->engine_factory && m_impl->config->service && m_impl->pipeline.first);
}

h2_server::~h2_server() {
  assert(m_impl);
#ifndef NDEBUG
  m_impl->tid = std::this_thread::get_id();
#endif
  // connections reference impl, so they must be done before it destroyed
  std::coroutine_handle h = m_impl->stop(/*close_connections=*/true).start_and_detach(/*stop_at_end=*/true);
  on_scope_exit {
    h.destroy();
  };
  if (ioctx().stopped())
    ioctx().restart();
  try {
    while (!h.done() && ioctx().run_one() != 0)
      ;
  } catch (std::exception& e) {
    H2BRIDGE_LOG(ERROR, "connections not stopped before server destroyed: {}", e.what(), m_impl->name);
  }
}

size_t h2_server::sessions_count() const noexcept {
  return m_impl->connections.size();
}

internet_address h2_server::listen(server_endpoint e) {
  return m_impl->listen(e);
}

dd::task<void> h2_server::shutdown() {
  return m_impl->stop(/*close_connections=*/false);
}

dd::task<void> h2_server::terminate() {
  return m_impl->stop(/*close_connections=*/true);
}

asio::io_context& h2_server::ioctx() {
  return m_impl->io;
}

void h2_server::request_stop() {
  shutdown().start_and_detach();
}

void h2_server::run() {
#ifndef NDEBUG
  m_impl->tid = std::this_thread::get_id();
#endif
  if (ioctx().stopped())
    ioctx().restart();
  ioctx().run();
}

}  // namespace h2bridge
