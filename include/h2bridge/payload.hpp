#pragma once

#include "h2bridge/h2_errors.hpp"
#include "h2bridge/utils/fn_ref.hpp"
#include "h2bridge/utils/memory.hpp"

#include <cassert>
#include <coroutine>
#include <deque>
#include <exception>

#include <boost/intrusive_ptr.hpp>
#include <kelcoro/task.hpp>

namespace h2bridge {

// flow-control credit of received, but not yet consumed bytes.
// Returning credit to transport allows peer to send more data for stream, so credit
// is returned only when bytes are taken by request body consumer (backpressure)
// remaining credit is returned on destroy
struct flow_credit {
 private:
  uint32_t m_size = 0;
  // invoked with count of bytes returned into transport flow-control accounting
  move_only_fn<void(uint32_t)> m_release;

 public:
  flow_credit() = default;
  flow_credit(uint32_t size, move_only_fn<void(uint32_t)> release) noexcept
      : m_size(size), m_release(std::move(release)) {
  }

  flow_credit(flow_credit&& other) noexcept
      : m_size(std::exchange(other.m_size, 0)), m_release(std::move(other.m_release)) {
  }
  flow_credit& operator=(flow_credit&& other) noexcept {
    if (this == &other)
      return *this;
    release_all();
    m_size = std::exchange(other.m_size, 0);
    m_release = std::move(other.m_release);
    return *this;
  }

  ~flow_credit() {
    release_all();
  }

  [[nodiscard]] uint32_t size() const noexcept {
    return m_size;
  }

  // returns min(n, size()) bytes to transport
  void consume(uint32_t n) noexcept;

  void release_all() noexcept {
    consume(m_size);
  }

  // joins credit of same stream, 'other' becomes empty
  void merge(flow_credit&& other) noexcept;
};

// state shared between payload_sender and payload
struct payload_channel {
  size_t refcount = 0;
  std::deque<bytes_t> chunks;
  // sum of chunks sizes
  size_t buffered = 0;
  flow_credit credit;
  std::exception_ptr error = nullptr;
  std::coroutine_handle<> waiter = nullptr;
  bool eof = false;
  bool consumer_dropped = false;

  explicit payload_channel(flow_credit c) noexcept : credit(std::move(c)) {
  }

  [[nodiscard]] bool terminated() const noexcept {
    return eof || error != nullptr;
  }

  void wake_waiter() {
    if (waiter)
      std::exchange(waiter, nullptr).resume();
  }

  friend void intrusive_ptr_add_ref(payload_channel* p) noexcept {
    ++p->refcount;
  }

  friend void intrusive_ptr_release(payload_channel* p) noexcept {
    --p->refcount;
    if (p->refcount == 0) {
      delete p;
    }
  }
};

using payload_channel_ptr = boost::intrusive_ptr<payload_channel>;

// producing end of payload channel, owned by publish handler stream table.
// Exactly one terminal call (feed_eof / set_error) expected, calls after it are ignored.
// If destroyed without terminal call, consumer receives 'incomplete payload' error
struct payload_sender {
 private:
  payload_channel_ptr chan;

 public:
  payload_sender() = default;
  explicit payload_sender(payload_channel_ptr c) noexcept : chan(std::move(c)) {
  }

  payload_sender(payload_sender&&) = default;
  payload_sender& operator=(payload_sender&&) noexcept;

  ~payload_sender();

  explicit operator bool() const noexcept {
    return chan != nullptr;
  }

  // appends 'chunk' and takes flow-control credit for it
  void feed_data(bytes_t chunk, flow_credit credit);
  // appends last chunk (may be empty) and marks payload completed
  void feed_eof(bytes_t chunk);
  // marks payload failed, all reads will throw 'e'
  void set_error(std::exception_ptr e);

  [[nodiscard]] bool terminated() const noexcept {
    return !chan || chan->terminated();
  }
};

// consuming end of payload channel, request body
struct payload {
 private:
  payload_channel_ptr chan;

  struct chunk_awaiter {
    payload_channel* ch;

    bool await_ready() const noexcept {
      return !ch->chunks.empty() || ch->terminated();
    }

    void await_suspend(std::coroutine_handle<> h) noexcept {
      assert(!ch->waiter && "only one reader at one time allowed");
      ch->waiter = h;
    }

    [[nodiscard]] bytes_t await_resume() const;
  };

 public:
  payload() = default;
  explicit payload(payload_channel_ptr c) noexcept : chan(std::move(c)) {
  }

  payload(payload&&) = default;
  payload& operator=(payload&&) noexcept;

  ~payload();

  explicit operator bool() const noexcept {
    return chan != nullptr;
  }

  [[nodiscard]] bool has_data() const noexcept {
    return chan && !chan->chunks.empty();
  }

  // true if all data received and consumed
  [[nodiscard]] bool last_chunk_received() const noexcept {
    return !chan || (chan->eof && chan->chunks.empty());
  }

  // returns awaiter, await returns empty data only when payload completed
  // throws error setted by sender
  // precondition: *this
  KELCORO_CO_AWAIT_REQUIRED chunk_awaiter next_chunk() noexcept {
    assert(chan);
    return chunk_awaiter{chan.get()};
  }

  // reads until payload completed
  dd::task<bytes_t> read_all();
};

// creates channel, 'initial' usually empty credit of stream, it will be used to return credit to transport
std::pair<payload_sender, payload> make_payload_channel(flow_credit initial);

}  // namespace h2bridge
