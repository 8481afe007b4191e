#include "h2bridge/payload.hpp"

#include "h2bridge/logger.hpp"

namespace h2bridge {

void flow_credit::consume(uint32_t n) noexcept {
  n = std::min(n, m_size);
  if (n == 0)
    return;
  m_size -= n;
  if (!m_release.has_value())
    return;
  try {
    m_release(n);
  } catch (std::exception& e) {
    H2BRIDGE_LOG_ERROR("cannot return {} bytes of flow-control credit, err: {}", n, e.what());
  }
}

void flow_credit::merge(flow_credit&& other) noexcept {
  if (this == &other)
    return;
  m_size += std::exchange(other.m_size, 0);
  if (!m_release.has_value())
    m_release = std::move(other.m_release);
}

static void drop_buffered(payload_channel& ch) noexcept {
  ch.credit.release_all();
  ch.chunks.clear();
  ch.buffered = 0;
}

struct incomplete_payload : std::exception {
  char const* what() const noexcept override {
    return "payload is incomplete, stream closed before end of data";
  }
};

payload_sender& payload_sender::operator=(payload_sender&& other) noexcept {
  if (this != &other) {
    payload_sender tmp(std::move(*this));
    chan = std::move(other.chan);
  }
  return *this;
}

payload_sender::~payload_sender() {
  if (chan && !chan->terminated())
    set_error(std::make_exception_ptr(incomplete_payload{}));
}

void payload_sender::feed_data(bytes_t chunk, flow_credit credit) {
  if (!chan || chan->terminated()) {
    H2BRIDGE_LOG_DEBUG("data chunk ({} bytes) after payload end ignored", chunk.size());
    return;
  }
  if (chan->consumer_dropped) {
    // nobody will read it, return credit to transport immediately
    credit.release_all();
    return;
  }
  chan->credit.merge(std::move(credit));
  if (chunk.empty())
    return;
  chan->buffered += chunk.size();
  chan->chunks.push_back(std::move(chunk));
  chan->wake_waiter();
}

void payload_sender::feed_eof(bytes_t chunk) {
  if (!chan || chan->terminated()) {
    H2BRIDGE_LOG_DEBUG("payload eof after payload end ignored");
    return;
  }
  // Note: order: set EOF, then push,
  // so if reader waits data again it will produce empty data (EOF marker)
  chan->eof = true;
  if (chan->consumer_dropped) {
    drop_buffered(*chan);
    return;
  }
  if (!chunk.empty()) {
    chan->buffered += chunk.size();
    chan->chunks.push_back(std::move(chunk));
  }
  // no more data will be received, padding and other not consumed credit is not needed
  if (chan->credit.size() > chan->buffered)
    chan->credit.consume(uint32_t(chan->credit.size() - chan->buffered));
  chan->wake_waiter();
}

void payload_sender::set_error(std::exception_ptr e) {
  assert(e);
  if (!chan || chan->terminated()) {
    H2BRIDGE_LOG_DEBUG("payload error after payload end ignored");
    return;
  }
  chan->error = std::move(e);
  drop_buffered(*chan);
  chan->wake_waiter();
}

bytes_t payload::chunk_awaiter::await_resume() const {
  if (ch->error)
    std::rethrow_exception(ch->error);
  if (ch->chunks.empty()) {
    assert(ch->eof);
    return {};
  }
  bytes_t chunk = std::move(ch->chunks.front());
  ch->chunks.pop_front();
  ch->buffered -= chunk.size();
  ch->credit.consume(uint32_t(chunk.size()));
  return chunk;
}

payload& payload::operator=(payload&& other) noexcept {
  if (this != &other) {
    payload tmp(std::move(*this));
    chan = std::move(other.chan);
  }
  return *this;
}

payload::~payload() {
  if (!chan)
    return;
  assert(!chan->waiter);
  chan->consumer_dropped = true;
  drop_buffered(*chan);
}

dd::task<bytes_t> payload::read_all() {
  assert(chan);
  bytes_t result;
  for (;;) {
    bytes_t chunk = co_await next_chunk();
    if (chunk.empty())
      co_return result;
    result.insert(result.end(), chunk.begin(), chunk.end());
  }
}

std::pair<payload_sender, payload> make_payload_channel(flow_credit initial) {
  payload_channel_ptr chan = new payload_channel(std::move(initial));
  return {payload_sender(chan), payload(chan)};
}

}  // namespace h2bridge
