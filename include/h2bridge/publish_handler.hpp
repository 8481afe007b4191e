#pragma once

#include "h2bridge/date_service.hpp"
#include "h2bridge/service.hpp"
#include "h2bridge/transport.hpp"
#include "h2bridge/utils/unique_name.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/intrusive_ptr.hpp>
#include <kelcoro/job.hpp>
#include <kelcoro/task.hpp>

namespace h2bridge {

// shared by all streams of one connection, read only after creation
struct dispatch_config {
  http_service_ptr service;
  // never null
  std::shared_ptr<date_service> dates = std::make_shared<date_service>();
  transport_options options;
};

using dispatch_config_ptr = std::shared_ptr<const dispatch_config>;

// throws request_error (missing_pseudo_header / malformed_uri)
[[nodiscard]] http_request make_request(const pseudo_headers&, http_headers_t, payload body, bool secure);

struct publish_handler;
using publish_handler_ptr = boost::intrusive_ptr<publish_handler>;

// per-connection stream table: stream id -> request body producer.
// Each HEADERS starts independent task, which makes request, invokes service and sends response.
// Task holds reference to handler, so handler lives until all tasks done
struct publish_handler final : publish_service_i {
 private:
  size_t refcount = 0;
  dispatch_config_ptr m_config;
  std::mutex m_mtx;
  std::unordered_map<stream_id_t, payload_sender> m_streams;
  size_t m_inflight = 0;
  bool m_secure = false;
  bool m_terminated = false;
  // disconnect timeout reached, remaining streams must not send anything
  bool m_abandoned = false;
  unique_name m_name;

  [[nodiscard]] bool stream_abandoned(stream_id_t) const;

  void on_headers(stream_ptr, headers_message);
  void on_data(stream_id_t, data_message);
  void on_eof(stream_id_t, eof_message);

  dd::task<void> respond(stream_i&, headers_message, payload);
  static dd::job stream_task(publish_handler_ptr, stream_ptr, headers_message, payload);

 public:
  // precondition: cfg && cfg->service && cfg->dates
  publish_handler(dispatch_config_ptr cfg, bool secure, unique_name name);

  publish_handler(publish_handler&&) = delete;
  void operator=(publish_handler&&) = delete;

  ~publish_handler() override;

  void handle(stream_message) override;

  // count of streams waiting request body data
  [[nodiscard]] size_t open_payloads();
  // count of streams which are processed (request or response in progress)
  [[nodiscard]] size_t inflight_streams() const noexcept {
    return m_inflight;
  }
  [[nodiscard]] bool terminated() const noexcept {
    return m_terminated;
  }
  [[nodiscard]] bool abandoned() const noexcept {
    return m_abandoned;
  }
  [[nodiscard]] const unique_name& name() const noexcept {
    return m_name;
  }

  // fails all open payloads with 'connection_closed', new streams refused after this call.
  // Waits in-flight streams at most disconnect_timeout, after it streams are abandoned:
  // their unsent response data is discarded and no more frames are sent for them
  dd::task<void> terminate(boost::asio::io_context&);

  friend void intrusive_ptr_add_ref(publish_handler* p) noexcept {
    ++p->refcount;
  }
  friend void intrusive_ptr_release(publish_handler* p) noexcept {
    --p->refcount;
    if (p->refcount == 0)
      delete p;
  }
};

}  // namespace h2bridge
