#include "listen/request_builder.hpp"

#include <array>

#include "util/string_util.hpp"

namespace hookrelay {
namespace http = boost::beast::http;

namespace {

constexpr std::array<std::string_view, 8> kHopByHop = {
    "connection",          "keep-alive", "proxy-authenticate",
    "proxy-authorization", "te",         "trailer",
    "transfer-encoding",   "upgrade"};

constexpr std::string_view kInternalPrefix = "x-hookdeck-internal-";

std::string NormalizeIncomingPath(const std::string &path) {
  if (path.empty()) {
    return "/";
  }
  if (path[0] != '/') {
    return '/' + path;
  }
  return path;
}

std::string JoinLocalPath(const std::string &base_path,
                          const std::string &incoming) {
  const std::string normalized = NormalizeIncomingPath(incoming);
  if (base_path.empty() || base_path == "/") {
    return normalized;
  }
  if (base_path.back() == '/') {
    if (normalized.size() > 1) {
      return base_path + normalized.substr(1);
    }
    return base_path;
  }
  if (normalized == "/") {
    return base_path;
  }
  return base_path + normalized;
}

} // namespace

bool is_hop_by_hop_header(std::string_view name) {
  for (auto h : kHopByHop) {
    if (stringutil::iequals(name, h)) {
      return true;
    }
  }
  return false;
}

bool is_internal_header(std::string_view name) {
  return stringutil::istarts_with(name, kInternalPrefix);
}

std::string effective_cli_path(const ForwardTarget &target,
                               const ConnectionDescriptor *connection) {
  if (!target.cli_path.empty()) {
    return target.cli_path;
  }
  if (connection) {
    return connection->destination_path();
  }
  return {};
}

std::string compose_local_target(const ForwardTarget &target,
                                 const std::string &cli_path,
                                 const InboundEvent &event) {
  std::string event_path = event.path;
  std::string query = event.query;
  if (const auto pos = event_path.find('?'); pos != std::string::npos) {
    // A query embedded in the path goes before the separate query field.
    std::string embedded = event_path.substr(pos + 1);
    event_path.resize(pos);
    if (!embedded.empty()) {
      query = query.empty() ? embedded : embedded + "&" + query;
    }
  }
  if (!query.empty() && query.front() == '?') {
    query.erase(0, 1);
  }

  std::string prefix = target.base_path;
  if (!cli_path.empty()) {
    prefix = JoinLocalPath(prefix, cli_path);
  }
  std::string result = JoinLocalPath(prefix, event_path);
  if (!query.empty()) {
    result += '?';
    result += query;
  }
  return result;
}

std::string compose_local_url(const ForwardTarget &target,
                              const std::string &cli_path,
                              const InboundEvent &event) {
  return target.scheme + "://" + target.host_header() +
         compose_local_target(target, cli_path, event);
}

LocalRequest build_local_request(const ForwardTarget &target,
                                 const std::string &cli_path,
                                 const InboundEvent &event) {
  LocalRequest req;
  req.version(11);
  auto verb = http::string_to_verb(event.method);
  if (verb == http::verb::unknown) {
    req.method_string(event.method);
  } else {
    req.method(verb);
  }
  req.target(compose_local_target(target, cli_path, event));

  std::string original_host;
  for (const auto &[name, value] : event.headers) {
    if (is_hop_by_hop_header(name) || is_internal_header(name)) {
      continue;
    }
    if (stringutil::iequals(name, "host")) {
      if (original_host.empty()) {
        original_host = value;
      }
      continue;
    }
    if (stringutil::iequals(name, "content-length")) {
      continue;
    }
    req.insert(name, value);
  }

  if (target.rewrite_host || original_host.empty()) {
    req.set(http::field::host, target.host_header());
  } else {
    req.set(http::field::host, original_host);
  }

  req.body() = event.body;
  req.prepare_payload();
  return req;
}

} // namespace hookrelay
