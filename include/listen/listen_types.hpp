#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hookrelay {

// Transport-level failure of one local delivery attempt.
enum class TransportError {
  kNone,
  kDial,
  kTimeout,
  kRead,
  kWrite,
  kTls,
  kBodyTooLarge,
  kCanceled,
};

std::string_view to_string(TransportError err);
std::optional<TransportError> transport_error_from_string(std::string_view s);

// Ordered header multimap; repeated names keep their relative order.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct ConnectionDescriptor {
  std::string connection_id;
  std::string connection_name;
  std::string source_id;
  std::string source_name;
  std::string destination_id;
  std::string destination_name;
  // Destinations come in two shapes; both are recorded as received.
  std::optional<std::string> destination_cli_path;    // top-level cli_path
  std::optional<std::string> destination_config_path; // config.path

  // config.path when present, else cli_path, else empty.
  std::string destination_path() const;
};

struct SessionFilters {
  std::optional<boost::json::value> body;
  std::optional<boost::json::value> headers;
  std::optional<boost::json::value> query;
  std::optional<boost::json::value> path;

  bool empty() const { return !body && !headers && !query && !path; }
};

struct Session {
  std::string session_id;
  std::string source_id;
  std::string source_name;
  std::vector<std::string> connection_ids;
  std::string control_url;
  std::string device_name;
  std::optional<SessionFilters> filters;
  std::vector<ConnectionDescriptor> connections;

  const ConnectionDescriptor *find_connection(const std::string &id) const;
};

struct ForwardTarget {
  std::string scheme{"http"};
  std::string host;
  std::string port{"80"};
  std::string base_path{"/"};
  // Prefix from --path; empty when the flag was not given.
  std::string cli_path;
  bool rewrite_host{true};

  bool secure() const { return scheme == "https"; }
  // host[:port], port omitted when it is the scheme default.
  std::string host_header() const;
  // scheme://host[:port] followed by the base path.
  std::string base_url() const;
};

struct InboundEvent {
  std::string id;
  std::string session_id;
  std::string connection_id;
  std::string source_id;
  std::string destination_id;
  std::string method;
  std::string path;
  std::string query;
  HeaderList headers;
  // Raw octets; decoded from base64 on receipt when flagged.
  std::string body;
  std::string received_at;
};

struct OutboundResponse {
  std::string event_id;
  int status{0};
  HeaderList headers;
  std::string body;
  std::int64_t latency_ms{0};
  TransportError transport_error{TransportError::kNone};
  bool filtered{false};
};

// Result of one local attempt, before it is framed for the control channel.
struct LocalOutcome {
  int status{0};
  HeaderList headers;
  std::string body;
  bool body_truncated{false};
  std::int64_t latency_ms{0};
  TransportError transport_error{TransportError::kNone};
  bool filtered{false};
  bool canceled{false};
  std::string detail;
};

} // namespace hookrelay
