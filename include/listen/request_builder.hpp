#pragma once

#include <boost/beast/http.hpp>

#include <string>
#include <string_view>

#include "listen/listen_types.hpp"

namespace hookrelay {

using LocalRequest =
    boost::beast::http::request<boost::beast::http::string_body>;

bool is_hop_by_hop_header(std::string_view name);

// Headers used by the service for its own bookkeeping, never forwarded.
bool is_internal_header(std::string_view name);

// --path wins; otherwise the destination path the service configured for
// the event's connection (nullptr when unknown).
std::string effective_cli_path(const ForwardTarget &target,
                               const ConnectionDescriptor *connection);

// base_path + cli_path + event.path, then "?" + event.query when non-empty.
std::string compose_local_target(const ForwardTarget &target,
                                 const std::string &cli_path,
                                 const InboundEvent &event);

// Display form of the local URL, scheme and authority included.
std::string compose_local_url(const ForwardTarget &target,
                              const std::string &cli_path,
                              const InboundEvent &event);

// Reconstructs the local HTTP/1.1 request. Headers are copied in order
// except hop-by-hop, internal and Content-Length ones; Host is rewritten
// to the target unless rewrite_host is off and the event carries one.
LocalRequest build_local_request(const ForwardTarget &target,
                                 const std::string &cli_path,
                                 const InboundEvent &event);

} // namespace hookrelay
