#include "h2bridge/asio/ssl_context.hpp"
#include "h2bridge/errors.hpp"
#include "h2bridge/logger.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace h2bridge {

// ALPN wire format, each name prefixed by its length
static constexpr unsigned char h2_protocol_list[] = {0x02, 'h', '2'};

static void disable_legacy_protocols(asio::ssl::context& ctx) {
  ctx.set_options(asio::ssl::context::default_workarounds | asio::ssl::context::no_sslv2 |
                  asio::ssl::context::no_sslv3 | asio::ssl::context::no_tlsv1 | asio::ssl::context::no_tlsv1_1 |
                  asio::ssl::context::no_compression);
}

static int select_h2(SSL*, const unsigned char** out, unsigned char* outlen, const unsigned char* in,
                     unsigned int inlen, void*) {
  unsigned char* selected = nullptr;
  if (SSL_select_next_proto(&selected, outlen, h2_protocol_list, sizeof(h2_protocol_list), in, inlen) !=
      OPENSSL_NPN_NEGOTIATED) {
    // handshake continues, tls acceptor rejects connection without negotiated "h2"
    return SSL_TLSEXT_ERR_NOACK;
  }
  *out = selected;
  return SSL_TLSEXT_ERR_OK;
}

ssl_context_ptr make_ssl_context_for_server(const std::filesystem::path& certificate,
                                            const std::filesystem::path& private_key) {
  ssl_context_ptr result = new ssl_context(asio::ssl::context_base::tls_server);
  asio::ssl::context& ctx = result->ctx;
  disable_legacy_protocols(ctx);
  ctx.set_options(asio::ssl::context::single_dh_use);

  io_error_code ec;
  ctx.use_certificate_chain_file(std::filesystem::absolute(certificate).string(), ec);
  if (ec)
    throw network_exception("cannot load certificate chain {}: {}", certificate.string(), ec.message());
  ctx.use_private_key_file(std::filesystem::absolute(private_key).string(), asio::ssl::context::pem, ec);
  if (ec)
    throw network_exception("cannot load private key {}: {}", private_key.string(), ec.message());

  SSL_CTX_set_alpn_select_cb(ctx.native_handle(), &select_h2, nullptr);
  H2BRIDGE_LOG_DEBUG("server tls context created, certificate: {}", certificate.string());
  return result;
}

ssl_context_ptr make_ssl_context_for_client() {
  ssl_context_ptr result = new ssl_context(asio::ssl::context::tls_client);
  asio::ssl::context& ctx = result->ctx;
  ctx.set_default_verify_paths();
  disable_legacy_protocols(ctx);
  // returns 0 on success
  if (SSL_CTX_set_alpn_protos(ctx.native_handle(), h2_protocol_list, sizeof(h2_protocol_list)) != 0)
    throw network_exception("cannot set ALPN protocols: {}", ERR_error_string(ERR_get_error(), nullptr));
  return result;
}

}  // namespace h2bridge
