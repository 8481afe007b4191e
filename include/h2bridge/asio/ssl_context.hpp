#pragma once

#include <filesystem>
#include <string_view>

#include <boost/asio/ssl/context.hpp>
#include <boost/intrusive_ptr.hpp>

namespace h2bridge {

namespace asio = boost::asio;

struct ssl_context;
// shared by all tls connections of acceptor, used only from server thread (OpenSSL context is not thread safe)
using ssl_context_ptr = boost::intrusive_ptr<ssl_context>;

struct ssl_context {
 private:
  size_t refcount = 0;

  // heap only, owned by ssl_context_ptr
  ~ssl_context() = default;

 public:
  asio::ssl::context ctx;

  explicit ssl_context(asio::ssl::context_base::method m) : ctx(m) {
  }

  ssl_context(ssl_context&&) = delete;
  void operator=(ssl_context&&) = delete;

  friend void intrusive_ptr_add_ref(ssl_context* p) noexcept {
    ++p->refcount;
  }
  friend void intrusive_ptr_release(ssl_context* p) noexcept {
    --p->refcount;
    if (p->refcount == 0)
      delete p;
  }
};

constexpr inline std::string_view ALPN_H2 = "h2";

// TLS 1.2+ server context, selects "h2" by ALPN if client offers it.
// Throws network_exception if certificate chain or private key (PEM) cannot be loaded
[[nodiscard]] ssl_context_ptr make_ssl_context_for_server(const std::filesystem::path& certificate,
                                                          const std::filesystem::path& private_key);

// TLS 1.2+ client context offering only "h2", used to connect to server in tests
[[nodiscard]] ssl_context_ptr make_ssl_context_for_client();

}  // namespace h2bridge
