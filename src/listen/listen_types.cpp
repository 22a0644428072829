#include "listen/listen_types.hpp"

namespace hookrelay {

std::string_view to_string(TransportError err) {
  switch (err) {
  case TransportError::kNone:
    return "none";
  case TransportError::kDial:
    return "dial";
  case TransportError::kTimeout:
    return "timeout";
  case TransportError::kRead:
    return "read";
  case TransportError::kWrite:
    return "write";
  case TransportError::kTls:
    return "tls";
  case TransportError::kBodyTooLarge:
    return "body_too_large";
  case TransportError::kCanceled:
    return "canceled";
  }
  return "none";
}

std::optional<TransportError> transport_error_from_string(std::string_view s) {
  static constexpr TransportError kAll[] = {
      TransportError::kNone,  TransportError::kDial,
      TransportError::kTimeout, TransportError::kRead,
      TransportError::kWrite, TransportError::kTls,
      TransportError::kBodyTooLarge, TransportError::kCanceled};
  for (auto err : kAll) {
    if (to_string(err) == s) {
      return err;
    }
  }
  return std::nullopt;
}

std::string ConnectionDescriptor::destination_path() const {
  if (destination_config_path && !destination_config_path->empty()) {
    return *destination_config_path;
  }
  if (destination_cli_path) {
    return *destination_cli_path;
  }
  return {};
}

const ConnectionDescriptor *
Session::find_connection(const std::string &id) const {
  for (const auto &c : connections) {
    if (c.connection_id == id) {
      return &c;
    }
  }
  return nullptr;
}

std::string ForwardTarget::host_header() const {
  const bool default_port = (scheme == "http" && port == "80") ||
                            (scheme == "https" && port == "443");
  const std::string name =
      host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (default_port || port.empty()) {
    return name;
  }
  return name + ":" + port;
}

std::string ForwardTarget::base_url() const {
  std::string url = scheme + "://" + host_header();
  if (base_path != "/") {
    url += base_path;
  }
  return url;
}

} // namespace hookrelay
