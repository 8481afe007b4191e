#include "h2bridge/publish_handler.hpp"

#include "h2bridge/asio/awaiters.hpp"
#include "h2bridge/logger.hpp"
#include "h2bridge/response_preparer.hpp"
#include "h2bridge/utils/macro.hpp"

#include <zal/zal.hpp>

namespace h2bridge {

http_request make_request(const pseudo_headers& pseudo, http_headers_t headers, payload body, bool secure) {
  if (!pseudo.path)
    throw missing_pseudo_header("path");
  if (!pseudo.method)
    throw missing_pseudo_header("method");

  http_request req;
  if (pseudo.authority) {
    if (!pseudo.scheme)
      throw missing_pseudo_header("scheme");
    req.uri = parse_uri(std::format("{}://{}{}", *pseudo.scheme, *pseudo.authority, *pseudo.path));
  } else {
    req.uri = parse_uri(*pseudo.path);
  }
  req.method_name = *pseudo.method;
  enum_from_string(req.method_name, req.method);
  req.headers = std::move(headers);
  req.body = std::move(body);
  req.secure = secure;
  return req;
}

static std::string exception_message(std::exception_ptr e) {
  assert(e);
  try {
    std::rethrow_exception(e);
  } catch (std::exception& x) {
    return x.what();
  }
}

publish_handler::publish_handler(dispatch_config_ptr cfg, bool secure, unique_name name)
    : m_config(std::move(cfg)), m_secure(secure), m_name(name) {
  assert(m_config && m_config->service && m_config->dates);
}

publish_handler::~publish_handler() {
  assert(m_inflight == 0);
  H2BRIDGE_LOG(TRACE, "publish handler destroyed", m_name);
}

size_t publish_handler::open_payloads() {
  std::lock_guard l(m_mtx);
  return m_streams.size();
}

void publish_handler::handle(stream_message msg) {
  assert(msg.stream);
  stream_id_t id = msg.id();
  switch (msg.kind.index()) {
    case 0:
      on_headers(std::move(msg.stream), std::move(*std::get_if<headers_message>(&msg.kind)));
      return;
    case 1:
      on_data(id, std::move(*std::get_if<data_message>(&msg.kind)));
      return;
    case 2:
      on_eof(id, std::move(*std::get_if<eof_message>(&msg.kind)));
      return;
    case 3:
      H2BRIDGE_LOG(TRACE, "stream {} event ignored: {}", id,
                   std::get_if<other_message>(&msg.kind)->description, m_name);
      return;
    default:
      unreachable();
  }
}

void publish_handler::on_headers(stream_ptr stream, headers_message msg) {
  stream_id_t id = stream->id();
  if (m_terminated) {
    H2BRIDGE_LOG(WARN, "stream {} refused, connection is closing", id, m_name);
    stream->reset(errc_e::REFUSED_STREAM);
    return;
  }
  payload body;
  // replaced producer (if stream id reused by engine) must be destroyed without table lock
  payload_sender old;
  if (!msg.end_stream) {
    H2BRIDGE_LOG(DEBUG, "creating request payload for stream {}", id, m_name);
    auto [sender, consumer] = make_payload_channel(stream->empty_capacity());
    {
      std::lock_guard l(m_mtx);
      old = std::exchange(m_streams[id], std::move(sender));
    }
    if (old)
      H2BRIDGE_LOG(ERROR, "stream {} received HEADERS twice, previous payload dropped", id, m_name);
    body = std::move(consumer);
  }
  stream_task(this, std::move(stream), std::move(msg), std::move(body));
}

void publish_handler::on_data(stream_id_t id, data_message msg) {
  H2BRIDGE_LOG(DEBUG, "got data chunk for stream {}, len: {}", id, msg.chunk.size(), m_name);
  payload_sender sender;
  {
    std::lock_guard l(m_mtx);
    auto it = m_streams.find(id);
    if (it == m_streams.end()) {
      H2BRIDGE_LOG(ERROR, "payload stream does not exist for stream {}", id, m_name);
      return;
    }
    sender = std::move(it->second);
  }
  // consumer may be resumed while feeding, table must not be locked
  sender.feed_data(std::move(msg.chunk), std::move(msg.credit));
  std::lock_guard l(m_mtx);
  auto it = m_streams.find(id);
  if (it != m_streams.end() && !it->second)
    it->second = std::move(sender);
}

void publish_handler::on_eof(stream_id_t id, eof_message msg) {
  payload_sender sender;
  {
    std::lock_guard l(m_mtx);
    auto it = m_streams.find(id);
    if (it == m_streams.end()) {
      H2BRIDGE_LOG(DEBUG, "eof for stream {} without payload", id, m_name);
      return;
    }
    sender = std::move(it->second);
    m_streams.erase(it);
  }
  if (!sender) {
    // eof while data is being delivered
    H2BRIDGE_LOG(ERROR, "stream {} eof during data delivering", id, m_name);
    return;
  }
  switch (msg.terminal.index()) {
    case 0:
      H2BRIDGE_LOG(DEBUG, "got payload eof for stream {}, last chunk len: {}", id,
                   std::get_if<eof_data>(&msg.terminal)->chunk.size(), m_name);
      sender.feed_eof(std::move(std::get_if<eof_data>(&msg.terminal)->chunk));
      return;
    case 1:
      H2BRIDGE_LOG(DEBUG, "got trailers for stream {}", id, m_name);
      sender.feed_eof({});
      return;
    case 2: {
      std::exception_ptr e = std::move(std::get_if<eof_error>(&msg.terminal)->error);
      H2BRIDGE_LOG(DEBUG, "stream {} payload failed", id, m_name);
      sender.set_error(e ? std::move(e) : std::make_exception_ptr(connection_closed{}));
      return;
    }
    default:
      unreachable();
  }
}

bool publish_handler::stream_abandoned(stream_id_t id) const {
  if (m_abandoned)
    H2BRIDGE_LOG(TRACE, "stream {} abandoned, response discarded", id, m_name);
  return m_abandoned;
}

dd::task<void> publish_handler::respond(stream_i& stream, headers_message msg, payload body) {
  const bool is_head = msg.pseudo.method == "HEAD";
  http_response rsp;
  try {
    http_request req = make_request(msg.pseudo, std::move(msg.headers), std::move(body), m_secure);
    H2BRIDGE_LOG(TRACE, "stream {} got request {} {} (has body: {})", stream.id(), req.method_name,
                 req.uri, req.has_body(), m_name);
    rsp = co_await m_config->service->handle_request(std::move(req));
  } catch (std::exception& e) {
    H2BRIDGE_LOG(DEBUG, "stream {} request failed: {}", stream.id(), e.what(), m_name);
    rsp = error_response(e);
  }
  if (stream_abandoned(stream.id()))
    co_return;

  http_response_head head{rsp.status, std::move(rsp.headers)};
  body_size size = rsp.body.size();
  prepare_response(*m_config->dates, head, size);

  H2BRIDGE_LOG(DEBUG, "stream {} response status: {}, payload: {} {}", stream.id(), head.status,
               e2str(size.kind), size.len, m_name);

  if (size.is_eof() || is_head) {
    stream.send_response(head.status, std::move(head.headers), true);
    co_return;
  }
  stream.send_response(head.status, std::move(head.headers), false);

  streaming_body_t chan = rsp.body.take_chunks();
  // create 'b' before loop to handle exception after loop
  auto b = co_await chan.begin();
  for (; b != chan.end(); (void)(co_await (++b))) {
    std::span<const byte_t> chunk = *b;
    if (chunk.empty())
      continue;
    if (stream_abandoned(stream.id()))
      co_return;
    H2BRIDGE_LOG(TRACE, "stream {} sending data chunk, len: {}", stream.id(), chunk.size(), m_name);
    co_await stream.send_payload(chunk, false);
  }
  if (stream_abandoned(stream.id()))
    co_return;
  if (std::exception_ptr e = chan.take_exception())
    throw body_stream_error(stream.id(), exception_message(e));

  H2BRIDGE_LOG(DEBUG, "stream {} closing payload", stream.id(), m_name);
  co_await stream.send_payload({}, true);
}

dd::job publish_handler::stream_task(publish_handler_ptr self, stream_ptr stream, headers_message msg,
                                     payload body) {
  ++self->m_inflight;
  on_scope_exit {
    --self->m_inflight;
  };
  try {
    co_await self->respond(*stream, std::move(msg), std::move(body));
  } catch (body_stream_error& e) {
    H2BRIDGE_LOG(ERROR, "{}", e.what(), self->m_name);
    if (!self->stream_abandoned(stream->id()))
      stream->reset(errc_e::INTERNAL_ERROR);
  } catch (stream_error& e) {
    // stream already reset by peer or closed with connection
    H2BRIDGE_LOG(DEBUG, "stream {} closed before response sent: {}", stream->id(), e.what(), self->m_name);
  } catch (std::exception& e) {
    H2BRIDGE_LOG(ERROR, "stream {} failed: {}", stream->id(), e.what(), self->m_name);
    if (!self->stream_abandoned(stream->id()))
      stream->reset(errc_e::INTERNAL_ERROR);
  }
}

dd::task<void> publish_handler::terminate(boost::asio::io_context& io) {
  m_terminated = true;
  std::unordered_map<stream_id_t, payload_sender> streams;
  {
    std::lock_guard l(m_mtx);
    streams.swap(m_streams);
  }
  H2BRIDGE_LOG(TRACE, "terminating, open payloads: {}, in-flight streams: {}", streams.size(), m_inflight,
               m_name);
  for (auto& [id, sender] : streams) {
    if (sender)
      sender.set_error(std::make_exception_ptr(connection_closed{}));
  }
  streams.clear();

  deadline_t deadline = deadline_after(m_config->options.disconnect_timeout);
  while (m_inflight != 0 && !deadline.reached())
    co_await net.sleep(io, std::chrono::milliseconds(1));
  if (m_inflight != 0) {
    m_abandoned = true;
    H2BRIDGE_LOG(WARN, "{} streams still in progress after disconnect timeout, abandoned", m_inflight, m_name);
  }
}

}  // namespace h2bridge
