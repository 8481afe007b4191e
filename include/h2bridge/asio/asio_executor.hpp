#pragma once

#include <coroutine>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

namespace h2bridge {

// continues coroutine on io_context thread.
// If 'force' is false and coroutine already there, it is not suspended
struct ioctx_transfer {
  boost::asio::io_context& ctx;
  bool force = false;

  bool await_ready() const noexcept {
    return !force && ctx.get_executor().running_in_this_thread();
  }
  void await_suspend(std::coroutine_handle<> h) {
    boost::asio::post(ctx, h);
  }
  static void await_resume() noexcept {
  }
};

// moves server operations (stop, listen) called from other threads onto server thread
inline ioctx_transfer jump_on_ioctx(boost::asio::io_context& ctx) noexcept {
  return ioctx_transfer{ctx, false};
}

// lets already queued handlers run before continuing
inline ioctx_transfer yield_on_ioctx(boost::asio::io_context& ctx) noexcept {
  return ioctx_transfer{ctx, true};
}

}  // namespace h2bridge
