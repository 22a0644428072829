#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/beast/core/error.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "conf/hookrelay_config.hpp"
#include "result.hpp"

namespace hookrelay {

struct ControlEndpoint {
  bool secure{true};
  std::string host;
  std::string port{"443"};
  // Path plus query, already encoded.
  std::string target{"/"};
};

// Accepts ws://, wss://, http:// and https:// URLs. With `no_wss` a secure
// URL is downgraded to ws:// (port 80 unless the URL names one).
Result<ControlEndpoint> parse_control_url(const std::string &url, bool no_wss);

// One message-oriented duplex link. All handlers run on the executor the
// transport was created with; callers keep at most one read and one write
// outstanding.
class IControlTransport {
public:
  using ConnectHandler =
      std::function<void(const boost::beast::error_code &, std::string detail)>;
  using ReadHandler =
      std::function<void(const boost::beast::error_code &, std::string payload)>;
  using WriteHandler = std::function<void(const boost::beast::error_code &)>;

  virtual ~IControlTransport() = default;

  virtual void AsyncConnect(ConnectHandler handler) = 0;
  virtual void AsyncRead(ReadHandler handler) = 0;
  virtual void AsyncWrite(std::string text, WriteHandler handler) = 0;
  virtual void AsyncClose(WriteHandler handler) = 0;
  // Aborts pending operations by closing the socket.
  virtual void Cancel() = 0;
};

using ControlTransportFactory = std::function<std::shared_ptr<IControlTransport>(
    const boost::asio::any_io_executor &)>;

struct ControlTransportOptions {
  bool verify_tls{true};
  // Non-empty: plain WebSocket over this Unix-domain socket.
  std::string unix_socket;
  std::string user_agent{"hookrelay"};
  std::chrono::milliseconds connect_timeout{10000};
  std::size_t max_message_bytes{32 * 1024 * 1024};
  EnvLookup env;
};

ControlTransportFactory
make_websocket_transport_factory(ControlEndpoint endpoint,
                                 ControlTransportOptions options);

} // namespace hookrelay
