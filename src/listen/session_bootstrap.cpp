#include "listen/session_bootstrap.hpp"

#include <fmt/format.h>
#include <regex>

#include "listen/session_filter.hpp"
#include "my_error_codes.hpp"

namespace hookrelay {

bool is_valid_source_name(const std::string &name) {
  static const std::regex kSourceName("^[A-Za-z0-9_-]+$");
  return std::regex_match(name, kSourceName);
}

ConnectionDescriptor to_connection_descriptor(const data::ConnectionModel &conn,
                                              const data::SourceModel &source) {
  ConnectionDescriptor desc;
  desc.connection_id = conn.id;
  desc.connection_name = conn.name;
  desc.source_id = conn.source.id.empty() ? source.id : conn.source.id;
  desc.source_name = conn.source.name.empty() ? source.name : conn.source.name;
  desc.destination_id = conn.destination.id;
  desc.destination_name = conn.destination.name;
  desc.destination_cli_path = conn.destination.cli_path;
  desc.destination_config_path = conn.destination.config_path;
  return desc;
}

Result<data::SourceModel>
SessionBootstrap::EnsureSource(const std::string &name) {
  auto found = api_.FindSourceByName(name);
  if (found.is_err()) {
    return Result<data::SourceModel>::Err(std::move(found.error()));
  }
  if (found.value()) {
    return Result<data::SourceModel>::Ok(std::move(*found.value()));
  }
  if (!is_valid_source_name(name)) {
    return Result<data::SourceModel>::Err(make_error(
        my_errors::LISTEN::INVALID_SOURCE_NAME,
        fmt::format("source '{}' does not exist and is not a valid name; use "
                    "letters, digits, '-' and '_'",
                    name)));
  }
  output_.info() << "Creating source " << name << std::endl;
  return api_.CreateSource(name);
}

Result<std::vector<data::ConnectionModel>>
SessionBootstrap::EnsureConnections(const data::SourceModel &source,
                                    const BootstrapRequest &request) {
  using ConnResult = Result<std::vector<data::ConnectionModel>>;
  auto listed = api_.ListConnections(source.id);
  if (listed.is_err()) {
    return ConnResult::Err(std::move(listed.error()));
  }

  std::vector<data::ConnectionModel> matching;
  for (auto &conn : listed.value()) {
    if (!conn.destination.is_cli()) {
      continue;
    }
    if (request.connection) {
      const auto &wanted = *request.connection;
      const bool by_name = conn.name == wanted;
      const bool by_path = !wanted.empty() && wanted.front() == '/' &&
                           conn.destination.path().find(wanted) !=
                               std::string::npos;
      if (!by_name && !by_path) {
        continue;
      }
    }
    matching.push_back(std::move(conn));
  }

  if (matching.empty()) {
    const std::string name =
        request.connection && !request.connection->empty() &&
                request.connection->front() != '/'
            ? *request.connection
            : source.name + "-cli";
    data::CreateConnectionRequest create;
    create.name = name;
    create.source_id = source.id;
    create.destination_name = name;
    create.destination_path = request.cli_path.value_or("/");
    output_.info() << "Creating connection " << name << std::endl;
    auto created = api_.CreateConnection(create);
    if (created.is_err()) {
      return ConnResult::Err(std::move(created.error()));
    }
    matching.push_back(std::move(created.value()));
    return ConnResult::Ok(std::move(matching));
  }

  if (request.cli_path) {
    if (matching.size() > 1) {
      return ConnResult::Err(make_error(
          my_errors::LISTEN::CONNECTION_AMBIGUOUS,
          fmt::format("--path needs a single connection but source '{}' has "
                      "{}; name the connection to update",
                      source.name, matching.size())));
    }
    auto &conn = matching.front();
    if (conn.destination.path() != *request.cli_path) {
      output_.info() << "Updating destination " << conn.destination.name
                     << " path to " << *request.cli_path << std::endl;
      auto updated =
          api_.UpdateDestinationPath(conn.destination.id, *request.cli_path);
      if (updated.is_err()) {
        return ConnResult::Err(std::move(updated.error()));
      }
      conn.destination.config_path = *request.cli_path;
    }
  }
  return ConnResult::Ok(std::move(matching));
}

Result<Session> SessionBootstrap::Run(const BootstrapRequest &request) {
  if (request.source_name.empty()) {
    return Result<Session>::Err(
        make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                   "a source name is required (argument or default_source)"));
  }
  auto source_r = EnsureSource(request.source_name);
  if (source_r.is_err()) {
    return Result<Session>::Err(std::move(source_r.error()));
  }
  const auto source = std::move(source_r.value());

  auto conns_r = EnsureConnections(source, request);
  if (conns_r.is_err()) {
    return Result<Session>::Err(std::move(conns_r.error()));
  }

  data::CreateSessionRequest create;
  create.source_id = source.id;
  create.device_name = request.device_name;
  for (const auto &conn : conns_r.value()) {
    create.connection_ids.push_back(conn.id);
  }
  if (request.filters && !request.filters->empty()) {
    create.filters = filters_to_json(*request.filters);
  }
  auto created = api_.CreateSession(create);
  if (created.is_err()) {
    auto err = std::move(created.error());
    if (err.code == my_errors::LISTEN::API_ERROR) {
      err.code = my_errors::LISTEN::SESSION_CREATE_FAILED;
    }
    return Result<Session>::Err(std::move(err));
  }

  Session session;
  session.session_id = created.value().id;
  session.source_id = source.id;
  session.source_name = source.name;
  session.device_name = request.device_name;
  session.filters = request.filters;
  session.control_url = created.value().control_url;
  if (session.control_url.empty()) {
    std::string base = request.ws_base_url;
    while (!base.empty() && base.back() == '/') {
      base.pop_back();
    }
    session.control_url = base + "/cli/sessions/" + session.session_id;
  }
  for (const auto &conn : conns_r.value()) {
    session.connection_ids.push_back(conn.id);
    session.connections.push_back(to_connection_descriptor(conn, source));
  }
  output_.debug() << "Session " << session.session_id << " control url "
                  << session.control_url << std::endl;
  return Result<Session>::Ok(std::move(session));
}

} // namespace hookrelay
