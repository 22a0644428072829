#include "listen/control_transport.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/url.hpp>

#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <optional>
#include <type_traits>
#include <utility>

#include "my_error_codes.hpp"
#include "util/my_logging.hpp"
#include "util/proxy_env.hpp"
#include "util/string_util.hpp"

namespace hookrelay {
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
namespace urls = boost::urls;
using tcp = net::ip::tcp;

Result<ControlEndpoint> parse_control_url(const std::string &url, bool no_wss) {
  auto parsed = urls::parse_uri(url);
  if (!parsed) {
    return Result<ControlEndpoint>::Err(make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        fmt::format("invalid control url '{}': {}", url, parsed.error().message())));
  }
  const auto scheme = stringutil::to_lower(std::string(parsed->scheme()));
  ControlEndpoint ep;
  if (scheme == "wss" || scheme == "https") {
    ep.secure = true;
  } else if (scheme == "ws" || scheme == "http") {
    ep.secure = false;
  } else {
    return Result<ControlEndpoint>::Err(
        make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                   fmt::format("unsupported control url scheme '{}'", scheme)));
  }
  if (no_wss) {
    ep.secure = false;
  }
  ep.host = std::string(parsed->host_address());
  if (ep.host.empty()) {
    return Result<ControlEndpoint>::Err(make_error(
        my_errors::GENERAL::INVALID_ARGUMENT, "control url has no host"));
  }
  if (parsed->has_port() && !parsed->port().empty()) {
    ep.port = std::string(parsed->port());
  } else {
    ep.port = ep.secure ? "443" : "80";
  }
  ep.target = std::string(parsed->encoded_path());
  if (ep.target.empty()) {
    ep.target = "/";
  }
  if (parsed->has_query()) {
    ep.target += "?";
    ep.target += std::string(parsed->encoded_query());
  }
  return Result<ControlEndpoint>::Ok(std::move(ep));
}

namespace {

using PlainWs = websocket::stream<beast::tcp_stream>;
using TlsWs = websocket::stream<ssl::stream<beast::tcp_stream>>;
using UnixStream = beast::basic_stream<net::local::stream_protocol>;
using UnixWs = websocket::stream<UnixStream>;

template <class Ws>
class WebsocketTransport
    : public IControlTransport,
      public std::enable_shared_from_this<WebsocketTransport<Ws>> {
  static constexpr bool kTls = std::is_same_v<Ws, TlsWs>;
  static constexpr bool kUnix = std::is_same_v<Ws, UnixWs>;

public:
  WebsocketTransport(const net::any_io_executor &ex, ControlEndpoint endpoint,
                     ControlTransportOptions options)
      : endpoint_(std::move(endpoint)), options_(std::move(options)),
        ssl_ctx_(ssl::context::tls_client), resolver_(ex),
        ws_(MakeStream(ex, ssl_ctx_)) {
    if constexpr (kTls) {
      ConfigureSsl();
    }
    ws_.text(true);
    ws_.read_message_max(options_.max_message_bytes);
  }

  void AsyncConnect(ConnectHandler handler) override {
    connect_handler_ = std::move(handler);
    if constexpr (kUnix) {
      BOOST_LOG_SEV(lg, trivial::debug)
          << "control channel dialing unix socket " << options_.unix_socket;
      beast::get_lowest_layer(ws_).expires_after(options_.connect_timeout);
      beast::get_lowest_layer(ws_).async_connect(
          net::local::stream_protocol::endpoint(options_.unix_socket),
          beast::bind_front_handler(&WebsocketTransport::OnUnixConnect,
                                    this->shared_from_this()));
    } else {
      if (options_.env) {
        proxy_ = proxy_for_target(kTls, endpoint_.host, options_.env);
      }
      const std::string &host = proxy_ ? proxy_->host : endpoint_.host;
      const std::string &port = proxy_ ? proxy_->port : endpoint_.port;
      BOOST_LOG_SEV(lg, trivial::debug)
          << "control channel resolving " << host << ':' << port
          << (proxy_ ? " (proxy)" : "");
      resolver_.async_resolve(
          host, port,
          beast::bind_front_handler(&WebsocketTransport::OnResolve,
                                    this->shared_from_this()));
    }
  }

  void AsyncRead(ReadHandler handler) override {
    ws_.async_read(read_buffer_,
                   [self = this->shared_from_this(),
                    handler = std::move(handler)](const beast::error_code &ec,
                                                  std::size_t bytes) {
                     if (ec) {
                       handler(ec, std::string());
                       return;
                     }
                     std::string payload =
                         beast::buffers_to_string(self->read_buffer_.data());
                     self->read_buffer_.consume(bytes);
                     handler(ec, std::move(payload));
                   });
  }

  void AsyncWrite(std::string text, WriteHandler handler) override {
    auto data = std::make_shared<std::string>(std::move(text));
    ws_.async_write(net::buffer(*data),
                    [self = this->shared_from_this(), data,
                     handler = std::move(handler)](const beast::error_code &ec,
                                                   std::size_t) { handler(ec); });
  }

  void AsyncClose(WriteHandler handler) override {
    if (!ws_.is_open()) {
      handler(beast::error_code{});
      return;
    }
    ws_.async_close(websocket::close_code::normal,
                    [self = this->shared_from_this(),
                     handler = std::move(handler)](const beast::error_code &ec) {
                      handler(ec);
                    });
  }

  void Cancel() override {
    resolver_.cancel();
    beast::get_lowest_layer(ws_).close();
  }

private:
  static Ws MakeStream(const net::any_io_executor &ex, ssl::context &ctx) {
    if constexpr (kTls) {
      return Ws(ex, ctx);
    } else {
      (void)ctx;
      return Ws(ex);
    }
  }

  void ConfigureSsl() {
    if (options_.verify_tls) {
      try {
        ssl_ctx_.set_default_verify_paths();
        ws_.next_layer().set_verify_mode(ssl::verify_peer);
        ws_.next_layer().set_verify_callback(
            ssl::host_name_verification(endpoint_.host));
      } catch (const std::exception &ex) {
        BOOST_LOG_SEV(lg, trivial::warning)
            << "control channel TLS verify setup failed, continuing: "
            << ex.what();
      }
    } else {
      ws_.next_layer().set_verify_mode(ssl::verify_none);
    }
  }

  void OnUnixConnect(const beast::error_code &ec) {
    if (ec) {
      Finish(ec, "unix connect");
      return;
    }
    StartWebsocketHandshake();
  }

  void OnResolve(const beast::error_code &ec,
                 tcp::resolver::results_type results) {
    if (ec) {
      Finish(ec, "resolve");
      return;
    }
    beast::get_lowest_layer(ws_).expires_after(options_.connect_timeout);
    beast::get_lowest_layer(ws_).async_connect(
        results, beast::bind_front_handler(&WebsocketTransport::OnTcpConnect,
                                           this->shared_from_this()));
  }

  void OnTcpConnect(const beast::error_code &ec,
                    const tcp::resolver::results_type::endpoint_type &) {
    if (ec) {
      Finish(ec, "connect");
      return;
    }
    if (proxy_) {
      SendProxyConnect();
      return;
    }
    OnTransportReady();
  }

  void SendProxyConnect() {
    const std::string authority = endpoint_.host + ":" + endpoint_.port;
    proxy_request_ = {};
    proxy_request_.method(http::verb::connect);
    proxy_request_.target(authority);
    proxy_request_.version(11);
    proxy_request_.set(http::field::host, authority);
    proxy_request_.set(http::field::user_agent, options_.user_agent);
    if (proxy_->authorization) {
      proxy_request_.set(http::field::proxy_authorization, *proxy_->authorization);
    }
    http::async_write(
        beast::get_lowest_layer(ws_), proxy_request_,
        beast::bind_front_handler(&WebsocketTransport::OnProxyWrite,
                                  this->shared_from_this()));
  }

  void OnProxyWrite(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Finish(ec, "proxy write");
      return;
    }
    proxy_parser_.emplace();
    // A CONNECT reply carries no body.
    proxy_parser_->skip(true);
    http::async_read(
        beast::get_lowest_layer(ws_), proxy_buffer_, *proxy_parser_,
        beast::bind_front_handler(&WebsocketTransport::OnProxyRead,
                                  this->shared_from_this()));
  }

  void OnProxyRead(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Finish(ec, "proxy read");
      return;
    }
    const auto status = proxy_parser_->get().result_int();
    if (status != 200) {
      Finish(make_error_code(net::error::connection_refused),
             fmt::format("proxy CONNECT refused with status {}", status));
      return;
    }
    OnTransportReady();
  }

  void OnTransportReady() {
    if constexpr (kTls) {
      if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(),
                                    endpoint_.host.c_str())) {
        beast::error_code sni_error{static_cast<int>(::ERR_get_error()),
                                    net::error::get_ssl_category()};
        Finish(sni_error, "set_sni");
        return;
      }
      ws_.next_layer().async_handshake(
          ssl::stream_base::client,
          beast::bind_front_handler(&WebsocketTransport::OnTlsHandshake,
                                    this->shared_from_this()));
    } else {
      StartWebsocketHandshake();
    }
  }

  void OnTlsHandshake(const beast::error_code &ec) {
    if (ec) {
      Finish(ec, "tls_handshake");
      return;
    }
    StartWebsocketHandshake();
  }

  void StartWebsocketHandshake() {
    // The websocket layer owns its timeouts from here on.
    beast::get_lowest_layer(ws_).expires_never();
    websocket::stream_base::timeout opt{options_.connect_timeout,
                                        websocket::stream_base::none(), false};
    ws_.set_option(opt);
    const std::string agent = options_.user_agent;
    ws_.set_option(websocket::stream_base::decorator(
        [agent](websocket::request_type &req) {
          req.set(http::field::user_agent,
                  agent + " " + BOOST_BEAST_VERSION_STRING);
        }));
    std::string host_header = endpoint_.host;
    const bool default_port =
        (endpoint_.secure && endpoint_.port == "443") ||
        (!endpoint_.secure && endpoint_.port == "80");
    if (!default_port) {
      host_header.append(":");
      host_header.append(endpoint_.port);
    }
    ws_.async_handshake(
        host_header, endpoint_.target,
        beast::bind_front_handler(&WebsocketTransport::OnWsHandshake,
                                  this->shared_from_this()));
  }

  void OnWsHandshake(const beast::error_code &ec) {
    if (ec) {
      Finish(ec, "ws_handshake");
      return;
    }
    Finish(ec, {});
  }

  void Finish(const beast::error_code &ec, std::string detail) {
    if (!connect_handler_) {
      return;
    }
    auto handler = std::exchange(connect_handler_, nullptr);
    if (ec) {
      BOOST_LOG_SEV(lg, trivial::debug)
          << "control channel connect failed at " << detail << ": "
          << ec.message();
    }
    handler(ec, std::move(detail));
  }

  ControlEndpoint endpoint_;
  ControlTransportOptions options_;
  ssl::context ssl_ctx_;
  tcp::resolver resolver_;
  Ws ws_;
  beast::flat_buffer read_buffer_;
  std::optional<ProxySettings> proxy_;
  http::request<http::empty_body> proxy_request_;
  beast::flat_buffer proxy_buffer_;
  std::optional<http::response_parser<http::empty_body>> proxy_parser_;
  ConnectHandler connect_handler_;
  src::severity_logger<trivial::severity_level> lg;
};

} // namespace

ControlTransportFactory
make_websocket_transport_factory(ControlEndpoint endpoint,
                                 ControlTransportOptions options) {
  return [endpoint = std::move(endpoint), options = std::move(options)](
             const net::any_io_executor &ex)
             -> std::shared_ptr<IControlTransport> {
    if (!options.unix_socket.empty()) {
      return std::make_shared<WebsocketTransport<UnixWs>>(ex, endpoint, options);
    }
    if (endpoint.secure) {
      return std::make_shared<WebsocketTransport<TlsWs>>(ex, endpoint, options);
    }
    return std::make_shared<WebsocketTransport<PlainWs>>(ex, endpoint, options);
  };
}

} // namespace hookrelay
