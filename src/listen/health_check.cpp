#include "listen/health_check.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <fmt/format.h>

#include "my_error_codes.hpp"

namespace hookrelay {
namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

VoidResult probe_forward_target(const ForwardTarget &target,
                                std::chrono::milliseconds timeout) {
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  beast::error_code result;

  resolver.async_resolve(
      target.host, target.port,
      [&](const beast::error_code &ec, tcp::resolver::results_type results) {
        if (ec) {
          result = ec;
          return;
        }
        stream.expires_after(timeout);
        stream.async_connect(
            results, [&](const beast::error_code &ec,
                         const tcp::resolver::results_type::endpoint_type &) {
              result = ec;
              stream.close();
            });
      });
  ioc.run();

  if (result) {
    return VoidResult::Err(make_error(
        my_errors::NETWORK::CONNECT_ERROR,
        fmt::format("{}:{} is not reachable: {}", target.host, target.port,
                    result.message())));
  }
  return VoidResult::Ok();
}

} // namespace hookrelay
