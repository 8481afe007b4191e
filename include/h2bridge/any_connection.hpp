#pragma once

#include "h2bridge/errors.hpp"
#include "h2bridge/utils/memory.hpp"

#include <coroutine>
#include <memory>
#include <span>
#include <string>

#include <kelcoro/task.hpp>

namespace h2bridge {

// negotiated byte stream (tcp or tls over tcp), produced by acceptor stages and
// consumed by transport engine
struct connection_i {
  // reads at least one byte, stores count of readen bytes into 'readen'
  virtual void start_read_some(std::coroutine_handle<> callback, std::span<byte_t> buf, size_t& readen,
                               io_error_code& ec) = 0;
  // writes whole buffer
  virtual void start_write(std::coroutine_handle<> callback, std::span<byte_t const> buf,
                           io_error_code& ec) = 0;
  // cancels all pending operations and closes connection
  virtual void shutdown() noexcept = 0;
  virtual bool is_secure() const noexcept = 0;
  // protocol selected by ALPN, empty if not negotiated
  virtual std::string_view alpn_protocol() const noexcept {
    return {};
  }
  // for logging, empty if unknown
  virtual std::string remote_address() const {
    return {};
  }

  virtual ~connection_i() = default;
};

using any_connection_t = std::unique_ptr<connection_i>;

// awaiters for using with .start_write / .start_read_some

struct read_some_awaiter {
  connection_i& con;
  io_error_code& ec;
  std::span<byte_t> buf;
  size_t readen = 0;

  static bool await_ready() noexcept {
    return false;
  }

  void await_suspend(std::coroutine_handle<> h) {
    con.start_read_some(h, buf, readen, ec);
  }
  // returns count of readen bytes
  size_t await_resume() const noexcept {
    return readen;
  }
};

struct write_awaiter {
  connection_i& con;
  io_error_code& ec;
  std::span<byte_t const> buf;

  bool await_ready() const noexcept {
    return buf.empty();
  }

  void await_suspend(std::coroutine_handle<> h) {
    con.start_write(h, buf, ec);
  }
  static void await_resume() noexcept {
  }
};

KELCORO_CO_AWAIT_REQUIRED inline read_some_awaiter read_some(connection_i& con, std::span<byte_t> buf,
                                                             io_error_code& ec) noexcept {
  return read_some_awaiter{con, ec, buf};
}

KELCORO_CO_AWAIT_REQUIRED inline write_awaiter write(connection_i& con, std::span<byte_t const> buf,
                                                     io_error_code& ec) noexcept {
  return write_awaiter{con, ec, buf};
}

}  // namespace h2bridge
