#pragma once

#include <optional>
#include <string>
#include <vector>

#include "api_client.hpp"
#include "customio/output.hpp"
#include "listen/listen_types.hpp"
#include "result.hpp"

namespace hookrelay {

struct BootstrapRequest {
  std::string source_name;
  // A connection name, or a path fragment when it starts with '/'.
  std::optional<std::string> connection;
  // --path; absent when the flag was not given.
  std::optional<std::string> cli_path;
  std::string device_name;
  std::optional<SessionFilters> filters;
  std::string ws_base_url;
};

bool is_valid_source_name(const std::string &name);

ConnectionDescriptor to_connection_descriptor(const data::ConnectionModel &conn,
                                              const data::SourceModel &source);

// Resolves (or creates) the source and its CLI connections, then opens the
// CLI session. Nothing is retried; the first failure aborts.
class SessionBootstrap {
public:
  SessionBootstrap(IApiClient &api, customio::IOutput &output)
      : api_(api), output_(output) {}

  Result<Session> Run(const BootstrapRequest &request);

private:
  Result<data::SourceModel> EnsureSource(const std::string &name);
  Result<std::vector<data::ConnectionModel>>
  EnsureConnections(const data::SourceModel &source,
                    const BootstrapRequest &request);

  IApiClient &api_;
  customio::IOutput &output_;
};

} // namespace hookrelay
