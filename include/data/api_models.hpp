#pragma once

#include <boost/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hookrelay::data {

namespace detail {

inline std::string string_field(const boost::json::object &obj,
                                const char *key) {
  if (auto *p = obj.if_contains(key); p && p->is_string()) {
    return boost::json::value_to<std::string>(*p);
  }
  return {};
}

inline std::optional<std::string> optional_string(const boost::json::object &obj,
                                                  const char *key) {
  if (auto *p = obj.if_contains(key); p && p->is_string()) {
    return boost::json::value_to<std::string>(*p);
  }
  return std::nullopt;
}

} // namespace detail

struct SourceModel {
  std::string id;
  std::string name;
  std::string url;
};

inline SourceModel tag_invoke(const boost::json::value_to_tag<SourceModel> &,
                              const boost::json::value &jv) {
  if (!jv.is_object()) {
    throw std::runtime_error("SourceModel expects JSON object");
  }
  const auto &obj = jv.as_object();
  SourceModel src{};
  src.id = detail::string_field(obj, "id");
  src.name = detail::string_field(obj, "name");
  src.url = detail::string_field(obj, "url");
  if (src.id.empty()) {
    throw std::runtime_error("SourceModel missing id");
  }
  return src;
}

// Destinations arrive either with a top-level cli_path or with
// config.path; both are kept as received.
struct DestinationModel {
  std::string id;
  std::string name;
  std::string type;
  std::optional<std::string> cli_path;
  std::optional<std::string> config_path;

  bool is_cli() const {
    return type == "CLI" || (cli_path && !cli_path->empty()) ||
           (config_path && !config_path->empty());
  }
  std::string path() const {
    if (config_path && !config_path->empty()) {
      return *config_path;
    }
    return cli_path.value_or(std::string());
  }
};

inline DestinationModel
tag_invoke(const boost::json::value_to_tag<DestinationModel> &,
           const boost::json::value &jv) {
  if (!jv.is_object()) {
    throw std::runtime_error("DestinationModel expects JSON object");
  }
  const auto &obj = jv.as_object();
  DestinationModel dst{};
  dst.id = detail::string_field(obj, "id");
  dst.name = detail::string_field(obj, "name");
  dst.type = detail::string_field(obj, "type");
  dst.cli_path = detail::optional_string(obj, "cli_path");
  if (auto *cfg = obj.if_contains("config"); cfg && cfg->is_object()) {
    dst.config_path = detail::optional_string(cfg->as_object(), "path");
  }
  return dst;
}

struct ConnectionModel {
  std::string id;
  std::string name;
  SourceModel source;
  DestinationModel destination;
};

inline ConnectionModel
tag_invoke(const boost::json::value_to_tag<ConnectionModel> &,
           const boost::json::value &jv) {
  if (!jv.is_object()) {
    throw std::runtime_error("ConnectionModel expects JSON object");
  }
  const auto &obj = jv.as_object();
  ConnectionModel conn{};
  conn.id = detail::string_field(obj, "id");
  conn.name = detail::string_field(obj, "name");
  if (conn.id.empty()) {
    throw std::runtime_error("ConnectionModel missing id");
  }
  if (auto *p = obj.if_contains("source"); p && p->is_object()) {
    conn.source = boost::json::value_to<SourceModel>(*p);
  }
  if (auto *p = obj.if_contains("destination"); p && p->is_object()) {
    conn.destination = boost::json::value_to<DestinationModel>(*p);
  }
  return conn;
}

struct CliSessionModel {
  std::string id;
  std::string control_url;
};

inline CliSessionModel
tag_invoke(const boost::json::value_to_tag<CliSessionModel> &,
           const boost::json::value &jv) {
  if (!jv.is_object()) {
    throw std::runtime_error("CliSessionModel expects JSON object");
  }
  const auto &obj = jv.as_object();
  CliSessionModel session{};
  session.id = detail::string_field(obj, "id");
  if (session.id.empty()) {
    throw std::runtime_error("CliSessionModel missing id");
  }
  session.control_url = detail::string_field(obj, "control_url");
  if (session.control_url.empty()) {
    session.control_url = detail::string_field(obj, "url");
  }
  return session;
}

struct CreateConnectionRequest {
  std::string name;
  std::string source_id;
  std::string destination_name;
  std::string destination_path{"/"};
};

inline void tag_invoke(const boost::json::value_from_tag &,
                       boost::json::value &jv,
                       const CreateConnectionRequest &req) {
  jv = boost::json::object{
      {"name", req.name},
      {"source_id", req.source_id},
      {"destination",
       boost::json::object{{"name", req.destination_name},
                           {"type", "CLI"},
                           {"config", boost::json::object{
                                          {"path", req.destination_path}}}}}};
}

struct CreateSessionRequest {
  std::string source_id;
  std::vector<std::string> connection_ids;
  std::string device_name;
  std::optional<boost::json::object> filters;
};

inline void tag_invoke(const boost::json::value_from_tag &,
                       boost::json::value &jv,
                       const CreateSessionRequest &req) {
  boost::json::array ids;
  for (const auto &id : req.connection_ids) {
    ids.emplace_back(id);
  }
  boost::json::object obj{{"source_id", req.source_id},
                          {"connection_ids", ids},
                          {"webhook_ids", ids},
                          {"device_name", req.device_name}};
  if (req.filters && !req.filters->empty()) {
    obj["filters"] = *req.filters;
  }
  jv = std::move(obj);
}

// List replies come as {"models": [...]} or as a bare array.
template <typename T>
std::vector<T> models_from_list(const boost::json::value &jv) {
  const boost::json::array *arr = nullptr;
  if (jv.is_array()) {
    arr = &jv.as_array();
  } else if (jv.is_object()) {
    if (auto *p = jv.as_object().if_contains("models"); p && p->is_array()) {
      arr = &p->as_array();
    }
  }
  if (!arr) {
    throw std::runtime_error("list reply has no models array");
  }
  std::vector<T> out;
  out.reserve(arr->size());
  for (const auto &item : *arr) {
    out.push_back(boost::json::value_to<T>(item));
  }
  return out;
}

} // namespace hookrelay::data
