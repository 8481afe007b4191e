#pragma once

#include "h2bridge/errors.hpp"
#include "h2bridge/utils/memory.hpp"

#include <chrono>
#include <coroutine>
#include <span>
#include <type_traits>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>

#include <kelcoro/task.hpp>

/*
kelcoro coroutines await asio operations through io_awaiter:
'start' receives completion handler and initiates operation, handler resumes coroutine.
Error is written into caller's error_code only if operation failed
*/

namespace h2bridge {

namespace asio = boost::asio;

// T is result of operation (bytes transferred) or void
template <typename T, typename Start>
struct io_awaiter {
  static_assert(std::is_trivially_copyable_v<T>);

  Start start;
  io_error_code& ec;
  T result = {};

  static bool await_ready() noexcept {
    return false;
  }
  void await_suspend(std::coroutine_handle<> h) {
    start([this, h](const io_error_code& e, T r) {
      if (e) [[unlikely]]
        ec = e;
      result = r;
      h.resume();
    });
  }
  T await_resume() const noexcept {
    return result;
  }
};

template <typename Start>
struct io_awaiter<void, Start> {
  Start start;
  io_error_code& ec;

  static bool await_ready() noexcept {
    return false;
  }
  void await_suspend(std::coroutine_handle<> h) {
    start([this, h](const io_error_code& e) {
      if (e) [[unlikely]]
        ec = e;
      h.resume();
    });
  }
  static void await_resume() noexcept {
  }
};

template <typename T, typename Start>
io_awaiter<T, Start> make_io_awaiter(io_error_code& ec, Start start) {
  return io_awaiter<T, Start>{std::move(start), ec};
}

// async operations used by connections and server, called explicitly to avoid asio overload sets and ADL
struct net_t {
  template <typename Protocol, typename Socket>
  KELCORO_CO_AWAIT_REQUIRED static auto accept(asio::basic_socket_acceptor<Protocol>& acceptor, Socket& socket,
                                               io_error_code& ec) {
    return make_io_awaiter<void>(ec, [&acceptor, &socket](auto cb) { acceptor.async_accept(socket, std::move(cb)); });
  }

  // server side tls handshake
  template <typename Stream>
  KELCORO_CO_AWAIT_REQUIRED static auto handshake(asio::ssl::stream<Stream>& stream,
                                                  asio::ssl::stream_base::handshake_type type, io_error_code& ec) {
    return make_io_awaiter<void>(ec, [&stream, type](auto cb) { stream.async_handshake(type, std::move(cb)); });
  }

  // writes whole buffer, returns count of bytes written
  template <typename Stream>
  KELCORO_CO_AWAIT_REQUIRED static auto write(Stream& stream, std::span<const byte_t> buffer, io_error_code& ec) {
    return make_io_awaiter<size_t>(ec, [&stream, buffer](auto cb) {
      asio::async_write(stream, asio::buffer(buffer.data(), buffer.size()), std::move(cb));
    });
  }

  template <typename Stream>
  KELCORO_CO_AWAIT_REQUIRED static auto read_some(Stream& stream, std::span<byte_t> buffer, io_error_code& ec) {
    return make_io_awaiter<size_t>(ec, [&stream, buffer](auto cb) {
      stream.async_read_some(asio::buffer(buffer.data(), buffer.size()), std::move(cb));
    });
  }

  // cancellation of timer is not an error for caller
  static dd::task<void> sleep(asio::io_context& io, std::chrono::nanoseconds duration) {
    asio::steady_timer timer(io, duration);
    io_error_code ec;
    co_await make_io_awaiter<void>(ec, [&timer](auto cb) { timer.async_wait(std::move(cb)); });
  }
};

constexpr inline net_t net = {};

}  // namespace h2bridge
