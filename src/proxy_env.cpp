#include "util/proxy_env.hpp"

#include <boost/url.hpp>

#include <fmt/format.h>

#include "util/string_util.hpp"

namespace hookrelay {
namespace urls = boost::urls;

namespace {

std::optional<std::string> first_env(const EnvLookup &env, const char *upper,
                                     const char *lower) {
  if (auto v = env(upper)) {
    return v;
  }
  return env(lower);
}

bool is_loopback(const std::string &host) {
  return host == "localhost" || host == "::1" || host == "[::1]" ||
         stringutil::starts_with(host, "127.");
}

} // namespace

std::optional<ProxySettings> parse_proxy_url(const std::string &url) {
  std::string candidate = stringutil::trim(url);
  if (candidate.empty()) {
    return std::nullopt;
  }
  if (candidate.find("://") == std::string::npos) {
    candidate = "http://" + candidate;
  }
  auto parsed = urls::parse_uri(candidate);
  if (!parsed || parsed->host().empty()) {
    return std::nullopt;
  }
  const auto &u = parsed.value();
  ProxySettings settings;
  settings.host = std::string(u.host());
  settings.port = u.has_port() ? std::string(u.port())
                               : (u.scheme() == "https" ? "443" : "80");
  if (u.has_userinfo()) {
    const std::string credentials =
        fmt::format("{}:{}", std::string(u.user()), std::string(u.password()));
    settings.authorization = "Basic " + stringutil::base64_encode(credentials);
  }
  return settings;
}

bool no_proxy_matches(const std::string &no_proxy, const std::string &host) {
  const std::string lowered_host = stringutil::to_lower(host);
  for (const auto &raw : stringutil::split(no_proxy, ',')) {
    std::string entry = stringutil::to_lower(stringutil::trim(raw));
    if (entry.empty()) {
      continue;
    }
    if (entry == "*") {
      return true;
    }
    if (const auto colon = entry.rfind(':');
        colon != std::string::npos && entry.find(']') == std::string::npos) {
      entry = entry.substr(0, colon);
    }
    if (entry.front() == '.') {
      entry = entry.substr(1);
    }
    if (lowered_host == entry ||
        stringutil::ends_with(lowered_host, "." + entry)) {
      return true;
    }
  }
  return false;
}

std::optional<ProxySettings> proxy_for_target(bool secure,
                                              const std::string &host,
                                              const EnvLookup &env) {
  if (is_loopback(host)) {
    return std::nullopt;
  }
  if (auto no_proxy = first_env(env, "NO_PROXY", "no_proxy");
      no_proxy && no_proxy_matches(*no_proxy, host)) {
    return std::nullopt;
  }
  auto proxy = secure ? first_env(env, "HTTPS_PROXY", "https_proxy")
                      : first_env(env, "HTTP_PROXY", "http_proxy");
  if (!proxy) {
    return std::nullopt;
  }
  return parse_proxy_url(*proxy);
}

} // namespace hookrelay
