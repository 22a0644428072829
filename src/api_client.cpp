#include "api_client.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/url.hpp>

#include <fmt/format.h>
#include <functional>
#include <memory>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <type_traits>

#include "my_error_codes.hpp"
#include "util/proxy_env.hpp"
#include "util/string_util.hpp"

namespace hookrelay {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = net::ssl;
namespace json = boost::json;
namespace urls = boost::urls;
using tcp = net::ip::tcp;

namespace {

using ApiRequest = http::request<http::string_body>;
using ApiResponse = http::response<http::string_body>;
using TlsStream = ssl::stream<beast::tcp_stream>;
using UnixStream = beast::basic_stream<net::local::stream_protocol>;

struct ApiEndpoint {
  bool secure{true};
  std::string host;
  std::string port{"443"};
  std::string base_path;
};

Result<ApiEndpoint> ParseApiBase(const std::string &base) {
  auto parsed = urls::parse_uri(base);
  if (!parsed) {
    return Result<ApiEndpoint>::Err(make_error(
        my_errors::GENERAL::INVALID_ARGUMENT,
        fmt::format("invalid api base url '{}': {}", base,
                    parsed.error().message())));
  }
  ApiEndpoint ep;
  const auto scheme = stringutil::to_lower(std::string(parsed->scheme()));
  if (scheme != "http" && scheme != "https") {
    return Result<ApiEndpoint>::Err(
        make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                   fmt::format("api base url must be http(s): {}", base)));
  }
  ep.secure = scheme == "https";
  ep.host = std::string(parsed->host_address());
  ep.port = parsed->has_port() && !parsed->port().empty()
                ? std::string(parsed->port())
                : (ep.secure ? "443" : "80");
  ep.base_path = std::string(parsed->encoded_path());
  while (!ep.base_path.empty() && ep.base_path.back() == '/') {
    ep.base_path.pop_back();
  }
  return Result<ApiEndpoint>::Ok(std::move(ep));
}

struct ExchangeResult {
  beast::error_code ec;
  std::string stage;
  ApiResponse response;
};

// One request/response exchange; the io_context is run by the caller.
template <class Stream>
class ApiExchange : public std::enable_shared_from_this<ApiExchange<Stream>> {
  static constexpr bool kTls = std::is_same_v<Stream, TlsStream>;
  static constexpr bool kUnix = std::is_same_v<Stream, UnixStream>;

public:
  ApiExchange(net::io_context &ioc, ssl::context &ctx, ApiEndpoint endpoint,
              ApiRequest request, std::optional<ProxySettings> proxy,
              std::string unix_socket, std::chrono::milliseconds timeout,
              ExchangeResult &out)
      : endpoint_(std::move(endpoint)), request_(std::move(request)),
        proxy_(std::move(proxy)), unix_socket_(std::move(unix_socket)),
        timeout_(timeout), out_(out), resolver_(ioc),
        stream_(MakeStream(ioc, ctx)) {}

  void Start() {
    beast::get_lowest_layer(stream_).expires_after(timeout_);
    if constexpr (kUnix) {
      beast::get_lowest_layer(stream_).async_connect(
          net::local::stream_protocol::endpoint(unix_socket_),
          [self = this->shared_from_this()](const beast::error_code &ec) {
            if (ec) {
              return self->Done(ec, "connect");
            }
            self->Write();
          });
    } else {
      const std::string &host = proxy_ ? proxy_->host : endpoint_.host;
      const std::string &port = proxy_ ? proxy_->port : endpoint_.port;
      resolver_.async_resolve(
          host, port,
          beast::bind_front_handler(&ApiExchange::OnResolve,
                                    this->shared_from_this()));
    }
  }

private:
  static Stream MakeStream(net::io_context &ioc, ssl::context &ctx) {
    if constexpr (kTls) {
      return Stream(ioc, ctx);
    } else {
      (void)ctx;
      return Stream(ioc);
    }
  }

  void OnResolve(const beast::error_code &ec,
                 tcp::resolver::results_type results) {
    if (ec) {
      return Done(ec, "resolve");
    }
    beast::get_lowest_layer(stream_).async_connect(
        results, beast::bind_front_handler(&ApiExchange::OnConnect,
                                           this->shared_from_this()));
  }

  void OnConnect(const beast::error_code &ec,
                 const tcp::resolver::results_type::endpoint_type &) {
    if (ec) {
      return Done(ec, "connect");
    }
    if (proxy_) {
      proxy_request_.method(http::verb::connect);
      proxy_request_.target(endpoint_.host + ":" + endpoint_.port);
      proxy_request_.version(11);
      proxy_request_.set(http::field::host, endpoint_.host + ":" + endpoint_.port);
      if (proxy_->authorization) {
        proxy_request_.set(http::field::proxy_authorization,
                           *proxy_->authorization);
      }
      http::async_write(
          beast::get_lowest_layer(stream_), proxy_request_,
          [self = this->shared_from_this()](const beast::error_code &ec,
                                            std::size_t) {
            if (ec) {
              return self->Done(ec, "proxy write");
            }
            self->proxy_parser_.skip(true);
            http::async_read(beast::get_lowest_layer(self->stream_),
                             self->buffer_, self->proxy_parser_,
                             beast::bind_front_handler(&ApiExchange::OnProxyReply,
                                                       self));
          });
      return;
    }
    Secure();
  }

  void OnProxyReply(const beast::error_code &ec, std::size_t) {
    if (ec) {
      return Done(ec, "proxy read");
    }
    if (proxy_parser_.get().result_int() != 200) {
      return Done(make_error_code(net::error::connection_refused),
                  fmt::format("proxy CONNECT status {}",
                              proxy_parser_.get().result_int()));
    }
    Secure();
  }

  void Secure() {
    if constexpr (kTls) {
      if (!SSL_set_tlsext_host_name(stream_.native_handle(),
                                    endpoint_.host.c_str())) {
        beast::error_code sni{static_cast<int>(::ERR_get_error()),
                              net::error::get_ssl_category()};
        return Done(sni, "set_sni");
      }
      stream_.set_verify_callback(ssl::host_name_verification(endpoint_.host));
      stream_.async_handshake(
          ssl::stream_base::client,
          [self = this->shared_from_this()](const beast::error_code &ec) {
            if (ec) {
              return self->Done(ec, "tls handshake");
            }
            self->Write();
          });
    } else {
      Write();
    }
  }

  void Write() {
    http::async_write(stream_, request_,
                      [self = this->shared_from_this()](
                          const beast::error_code &ec, std::size_t) {
                        if (ec) {
                          return self->Done(ec, "write");
                        }
                        self->parser_.body_limit(16 * 1024 * 1024);
                        http::async_read(
                            self->stream_, self->buffer_, self->parser_,
                            [self](const beast::error_code &ec, std::size_t) {
                              if (ec) {
                                return self->Done(ec, "read");
                              }
                              self->out_.response = self->parser_.release();
                              self->Done({}, {});
                            });
                      });
  }

  void Done(const beast::error_code &ec, std::string stage) {
    out_.ec = ec;
    out_.stage = std::move(stage);
    beast::get_lowest_layer(stream_).close();
  }

  ApiEndpoint endpoint_;
  ApiRequest request_;
  std::optional<ProxySettings> proxy_;
  std::string unix_socket_;
  std::chrono::milliseconds timeout_;
  ExchangeResult &out_;
  tcp::resolver resolver_;
  Stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::empty_body> proxy_request_;
  http::response_parser<http::empty_body> proxy_parser_;
  http::response_parser<http::string_body> parser_;
};

int NetworkErrorCode(const beast::error_code &ec, const std::string &stage) {
  if (ec == beast::error::timeout) {
    return my_errors::NETWORK::TIMEOUT_ERROR;
  }
  if (stage.rfind("proxy", 0) == 0) {
    return my_errors::NETWORK::PROXY_ERROR;
  }
  if (stage == "tls handshake" || stage == "set_sni") {
    return my_errors::NETWORK::SSL_HANDSHAKE_ERROR;
  }
  if (stage == "write") {
    return my_errors::NETWORK::WRITE_ERROR;
  }
  if (stage == "read") {
    return my_errors::NETWORK::READ_ERROR;
  }
  return my_errors::NETWORK::CONNECT_ERROR;
}

std::string UrlEncode(const std::string &value) {
  return urls::encode(value, urls::unreserved_chars);
}

template <typename T, typename Fn>
Result<T> Decode(Result<json::value> reply, const char *what, Fn &&fn) {
  if (reply.is_err()) {
    return Result<T>::Err(std::move(reply.error()));
  }
  try {
    return Result<T>::Ok(fn(reply.value()));
  } catch (const std::exception &ex) {
    return Result<T>::Err(make_error(
        my_errors::GENERAL::UNEXPECTED_RESULT,
        fmt::format("unexpected {} reply: {}", what, ex.what())));
  }
}

} // namespace

Error api_error_from_reply(int status, const std::string &reason,
                           const std::string &body) {
  std::string message;
  boost::system::error_code ec;
  auto jv = json::parse(body, ec);
  if (!ec && jv.is_object()) {
    if (auto *m = jv.as_object().if_contains("message"); m && m->is_string()) {
      message = json::value_to<std::string>(*m);
    }
  }
  if (message.empty()) {
    message = stringutil::trim(body);
  }
  if (message.empty()) {
    message = fmt::format("unexpected http status code: {} {}", status, reason);
  }
  int code = my_errors::LISTEN::API_ERROR;
  if (status == 401) {
    code = my_errors::GENERAL::UNAUTHORIZED;
  } else if (status == 403) {
    code = my_errors::GENERAL::FORBIDDEN;
  } else if (status == 404) {
    code = my_errors::GENERAL::NOT_FOUND;
  }
  return make_error(code, std::move(message), status);
}

std::string basic_auth_header(const std::string &api_key) {
  return "Basic " + stringutil::base64_encode(api_key + ":");
}

HttpApiClient::HttpApiClient(IHookrelayConfigProvider &config_provider,
                             customio::IOutput &output)
    : config_provider_(config_provider), output_(output) {}

Result<json::value>
HttpApiClient::Call(http::verb method, const std::string &path,
                    const std::optional<json::value> &body) {
  const auto &config = config_provider_.get();
  auto endpoint_r = ParseApiBase(config.api_base_url);
  if (endpoint_r.is_err()) {
    return Result<json::value>::Err(std::move(endpoint_r.error()));
  }
  auto endpoint = std::move(endpoint_r.value());

  ApiRequest req{method, endpoint.base_path + path, 11};
  const bool default_port = (endpoint.secure && endpoint.port == "443") ||
                            (!endpoint.secure && endpoint.port == "80");
  req.set(http::field::host,
          default_port ? endpoint.host : endpoint.host + ":" + endpoint.port);
  req.set(http::field::user_agent, fmt::format("hookrelay/{}", HOOKRELAY_VERSION));
  req.set(http::field::accept, "application/json");
  req.set(http::field::authorization, basic_auth_header(config.api_key));
  if (!config.project_id.empty()) {
    req.set("X-Project-Id", config.project_id);
  }
  if (body) {
    req.set(http::field::content_type, "application/json");
    req.body() = json::serialize(*body);
  }
  req.prepare_payload();

  output_.debug() << http::to_string(method) << " " << req.target()
                  << std::endl;

  net::io_context ioc;
  ssl::context ctx(ssl::context::tls_client);
  ExchangeResult out;
  if (!config.unix_socket.empty()) {
    std::make_shared<ApiExchange<UnixStream>>(ioc, ctx, endpoint, std::move(req),
                                              std::nullopt, config.unix_socket,
                                              timeout_, out)
        ->Start();
  } else {
    auto proxy = proxy_for_target(endpoint.secure, endpoint.host, process_env);
    if (endpoint.secure) {
      try {
        ctx.set_default_verify_paths();
      } catch (const std::exception &ex) {
        BOOST_LOG_SEV(lg, trivial::warning)
            << "default verify paths unavailable: " << ex.what();
      }
      ctx.set_verify_mode(ssl::verify_peer);
      std::make_shared<ApiExchange<TlsStream>>(ioc, ctx, endpoint,
                                               std::move(req), proxy,
                                               std::string(), timeout_, out)
          ->Start();
    } else {
      std::make_shared<ApiExchange<beast::tcp_stream>>(
          ioc, ctx, endpoint, std::move(req), proxy, std::string(), timeout_,
          out)
          ->Start();
    }
  }
  ioc.run();

  if (out.ec) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "api " << path << " failed at " << out.stage << ": "
        << out.ec.message();
    return Result<json::value>::Err(make_error(
        NetworkErrorCode(out.ec, out.stage),
        fmt::format("request to {} failed ({}): {}", endpoint.host, out.stage,
                    out.ec.message())));
  }
  const int status = out.response.result_int();
  if (status < 200 || status >= 300) {
    return Result<json::value>::Err(api_error_from_reply(
        status, std::string(out.response.reason()), out.response.body()));
  }
  if (out.response.body().empty()) {
    return Result<json::value>::Ok(json::value(nullptr));
  }
  boost::system::error_code ec;
  auto jv = json::parse(out.response.body(), ec);
  if (ec) {
    return Result<json::value>::Err(
        make_error(my_errors::GENERAL::JSON_PARSE_ERROR,
                   fmt::format("invalid JSON from {}: {}", path, ec.message())));
  }
  return Result<json::value>::Ok(std::move(jv));
}

Result<std::optional<data::SourceModel>>
HttpApiClient::FindSourceByName(const std::string &name) {
  return Decode<std::optional<data::SourceModel>>(
      Call(http::verb::get, "/sources?name=" + UrlEncode(name)), "sources",
      [](const json::value &jv) -> std::optional<data::SourceModel> {
        auto models = data::models_from_list<data::SourceModel>(jv);
        if (models.empty()) {
          return std::nullopt;
        }
        return models.front();
      });
}

Result<data::SourceModel> HttpApiClient::CreateSource(const std::string &name) {
  return Decode<data::SourceModel>(
      Call(http::verb::post, "/sources", json::value(json::object{{"name", name}})),
      "source", [](const json::value &jv) {
        return json::value_to<data::SourceModel>(jv);
      });
}

Result<std::vector<data::ConnectionModel>>
HttpApiClient::ListConnections(const std::string &source_id) {
  return Decode<std::vector<data::ConnectionModel>>(
      Call(http::verb::get, "/connections?source_id=" + UrlEncode(source_id)),
      "connections", [](const json::value &jv) {
        return data::models_from_list<data::ConnectionModel>(jv);
      });
}

Result<data::ConnectionModel>
HttpApiClient::CreateConnection(const data::CreateConnectionRequest &request) {
  return Decode<data::ConnectionModel>(
      Call(http::verb::post, "/connections", json::value_from(request)),
      "connection", [](const json::value &jv) {
        return json::value_to<data::ConnectionModel>(jv);
      });
}

Result<data::DestinationModel>
HttpApiClient::UpdateDestinationPath(const std::string &destination_id,
                                     const std::string &path) {
  json::value body = json::object{{"config", json::object{{"path", path}}}};
  return Decode<data::DestinationModel>(
      Call(http::verb::put, "/destinations/" + UrlEncode(destination_id), body),
      "destination", [](const json::value &jv) {
        return json::value_to<data::DestinationModel>(jv);
      });
}

Result<data::CliSessionModel>
HttpApiClient::CreateSession(const data::CreateSessionRequest &request) {
  return Decode<data::CliSessionModel>(
      Call(http::verb::post, "/cli-sessions", json::value_from(request)),
      "cli session", [](const json::value &jv) {
        return json::value_to<data::CliSessionModel>(jv);
      });
}

} // namespace hookrelay
