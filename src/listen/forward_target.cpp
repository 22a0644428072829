#include "listen/forward_target.hpp"

#include <boost/url.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <regex>

#include "my_error_codes.hpp"
#include "util/string_util.hpp"

namespace hookrelay {
namespace urls = boost::urls;

namespace {

Result<ForwardTarget> InvalidTarget(std::string message) {
  return Result<ForwardTarget>::Err(
      make_error(my_errors::GENERAL::INVALID_ARGUMENT, std::move(message)));
}

bool AllDigits(const std::string &s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

} // namespace

bool is_valid_cli_path(const std::string &path) {
  static const std::regex kPathPattern(
      R"(^(/)+([/a-zA-Z0-9\-_%.~!$&'()*+,;=:@]*)$)");
  return std::regex_match(path, kPathPattern);
}

Result<ForwardTarget> parse_forward_target(const std::string &arg,
                                           const std::string &cli_path) {
  if (!cli_path.empty() && !is_valid_cli_path(cli_path)) {
    return InvalidTarget(fmt::format(
        "--path '{}' is not a valid URL path (it must start with '/')",
        cli_path));
  }

  std::string candidate = stringutil::trim(arg);
  if (candidate.empty()) {
    return InvalidTarget("a port or forwarding URL is required");
  }

  if (AllDigits(candidate)) {
    unsigned long port = 0;
    try {
      port = std::stoul(candidate);
    } catch (const std::exception &) {
      port = 0;
    }
    if (port == 0 || port > 65535) {
      return InvalidTarget(
          fmt::format("port '{}' is outside the range 1-65535", candidate));
    }
    candidate = fmt::format("http://localhost:{}", port);
  } else if (!stringutil::istarts_with(candidate, "http://") &&
             !stringutil::istarts_with(candidate, "https://")) {
    if (candidate.find("://") != std::string::npos) {
      return InvalidTarget(fmt::format(
          "forwarding URL '{}' must use http:// or https://", candidate));
    }
    candidate = "http://" + candidate;
  }

  auto parsed = urls::parse_uri(candidate);
  if (!parsed) {
    return InvalidTarget(fmt::format("invalid forwarding URL '{}': {}", arg,
                                     parsed.error().message()));
  }
  const auto &url = parsed.value();
  if (!url.has_authority() || url.host().empty()) {
    return InvalidTarget(fmt::format("forwarding URL '{}' has no host", arg));
  }
  if (url.has_query()) {
    return InvalidTarget(fmt::format(
        "forwarding URL '{}' must not contain a query string", arg));
  }

  ForwardTarget target;
  target.scheme = stringutil::to_lower(std::string(url.scheme()));
  if (url.host_type() == urls::host_type::ipv6) {
    target.host = std::string(url.host_address());
  } else {
    target.host = std::string(url.host());
  }
  if (url.has_port()) {
    if (url.port_number() == 0) {
      return InvalidTarget(
          fmt::format("forwarding URL '{}' has an invalid port", arg));
    }
    target.port = std::to_string(url.port_number());
  } else {
    target.port = target.secure() ? "443" : "80";
  }
  std::string base_path = std::string(url.encoded_path());
  if (base_path.empty()) {
    base_path = "/";
  }
  target.base_path = base_path;
  target.cli_path = cli_path;
  return Result<ForwardTarget>::Ok(std::move(target));
}

} // namespace hookrelay
