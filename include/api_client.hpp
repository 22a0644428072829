#pragma once

#include <boost/beast/http/verb.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "conf/hookrelay_config.hpp"
#include "customio/output.hpp"
#include "data/api_models.hpp"
#include "result.hpp"
#include "util/my_logging.hpp"

namespace hookrelay {

// The REST calls session bootstrap needs. Non-2xx replies come back as
// errors carrying the server's message verbatim.
class IApiClient {
public:
  virtual ~IApiClient() = default;

  virtual Result<std::optional<data::SourceModel>>
  FindSourceByName(const std::string &name) = 0;
  virtual Result<data::SourceModel> CreateSource(const std::string &name) = 0;
  virtual Result<std::vector<data::ConnectionModel>>
  ListConnections(const std::string &source_id) = 0;
  virtual Result<data::ConnectionModel>
  CreateConnection(const data::CreateConnectionRequest &request) = 0;
  virtual Result<data::DestinationModel>
  UpdateDestinationPath(const std::string &destination_id,
                        const std::string &path) = 0;
  virtual Result<data::CliSessionModel>
  CreateSession(const data::CreateSessionRequest &request) = 0;
};

// Maps a non-2xx reply to an Error: the JSON "message" when present, else
// the raw body, else a generic text. 401 and 403 get their own codes.
Error api_error_from_reply(int status, const std::string &reason,
                           const std::string &body);

// HTTP Basic with the API key as user name and an empty password.
std::string basic_auth_header(const std::string &api_key);

/**
 * Blocking REST client used during startup. Each call runs on a private
 * io_context with a deadline; TLS, the proxy environment and the Unix
 * socket override are honoured.
 */
class HttpApiClient : public IApiClient {
public:
  HttpApiClient(IHookrelayConfigProvider &config_provider,
                customio::IOutput &output);

  Result<std::optional<data::SourceModel>>
  FindSourceByName(const std::string &name) override;
  Result<data::SourceModel> CreateSource(const std::string &name) override;
  Result<std::vector<data::ConnectionModel>>
  ListConnections(const std::string &source_id) override;
  Result<data::ConnectionModel>
  CreateConnection(const data::CreateConnectionRequest &request) override;
  Result<data::DestinationModel>
  UpdateDestinationPath(const std::string &destination_id,
                        const std::string &path) override;
  Result<data::CliSessionModel>
  CreateSession(const data::CreateSessionRequest &request) override;

  Result<boost::json::value>
  Call(boost::beast::http::verb method, const std::string &path,
       const std::optional<boost::json::value> &body = std::nullopt);

  void set_timeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

private:
  IHookrelayConfigProvider &config_provider_;
  customio::IOutput &output_;
  std::chrono::milliseconds timeout_{30000};
  src::severity_logger<trivial::severity_level> lg;
};

} // namespace hookrelay
