#pragma once

#include <optional>
#include <string>

#include "conf/hookrelay_config.hpp"

namespace hookrelay {

struct ProxySettings {
  std::string host;
  std::string port{"80"};
  // Value for Proxy-Authorization when the proxy URL carries credentials.
  std::optional<std::string> authorization;
};

// Parses "http://[user:pass@]host[:port]" (scheme optional).
std::optional<ProxySettings> parse_proxy_url(const std::string &url);

// True when `host` is excluded by a NO_PROXY list: comma separated host
// names or domain suffixes, "*" for everything.
bool no_proxy_matches(const std::string &no_proxy, const std::string &host);

// Picks HTTPS_PROXY or HTTP_PROXY (either case) for the given target,
// honouring NO_PROXY. Loopback targets never use a proxy.
std::optional<ProxySettings> proxy_for_target(bool secure,
                                              const std::string &host,
                                              const EnvLookup &env);

} // namespace hookrelay
