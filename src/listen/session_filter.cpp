#include "listen/session_filter.hpp"

#include <boost/url.hpp>

#include <fmt/format.h>
#include <optional>
#include <stdexcept>

#include "util/string_util.hpp"

namespace hookrelay {
namespace json = boost::json;
namespace urls = boost::urls;

namespace {

bool MatchValue(const json::value &predicate, const json::value *subject);

bool IsOperatorObject(const json::object &obj) {
  if (obj.empty()) {
    return false;
  }
  for (const auto &kv : obj) {
    if (kv.key().empty() || kv.key().front() != '$') {
      return false;
    }
  }
  return true;
}

std::string_view AsView(const json::string &s) {
  return std::string_view(s.data(), s.size());
}

bool ScalarEquals(const json::value &a, const json::value &b) {
  if (a.is_number() && b.is_number()) {
    return a.to_number<double>() == b.to_number<double>();
  }
  return a == b;
}

// -1, 0, 1 for comparable pairs (two numbers or two strings), nullopt else.
std::optional<int> Compare(const json::value &subject,
                           const json::value &operand) {
  if (subject.is_number() && operand.is_number()) {
    const double l = subject.to_number<double>();
    const double r = operand.to_number<double>();
    return l < r ? -1 : (l > r ? 1 : 0);
  }
  if (subject.is_string() && operand.is_string()) {
    const int c = AsView(subject.as_string()).compare(AsView(operand.as_string()));
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
  }
  return std::nullopt;
}

bool Contains(const json::value &container, const json::value &needle) {
  if (container.is_array()) {
    for (const auto &item : container.as_array()) {
      if (ScalarEquals(item, needle)) {
        return true;
      }
    }
    return false;
  }
  if (container.is_string() && needle.is_string()) {
    return AsView(container.as_string()).find(AsView(needle.as_string())) !=
           std::string_view::npos;
  }
  return false;
}

bool ApplyOperator(std::string_view op, const json::value &operand,
                   const json::value *subject) {
  if (op == "$exist") {
    const bool wanted = operand.is_bool() ? operand.as_bool() : true;
    const bool present = subject != nullptr && !subject->is_null();
    return wanted == present;
  }
  if (op == "$or") {
    if (!operand.is_array()) {
      return false;
    }
    for (const auto &alt : operand.as_array()) {
      if (MatchValue(alt, subject)) {
        return true;
      }
    }
    return false;
  }
  if (op == "$and") {
    if (!operand.is_array()) {
      return false;
    }
    for (const auto &alt : operand.as_array()) {
      if (!MatchValue(alt, subject)) {
        return false;
      }
    }
    return true;
  }
  if (op == "$not") {
    return !MatchValue(operand, subject);
  }
  if (op == "$neq") {
    return !MatchValue(operand, subject);
  }
  if (subject == nullptr) {
    return false;
  }
  if (op == "$eq") {
    return MatchValue(operand, subject);
  }
  if (op == "$gt" || op == "$gte" || op == "$lt" || op == "$lte") {
    auto cmp = Compare(*subject, operand);
    if (!cmp) {
      return false;
    }
    if (op == "$gt") {
      return *cmp > 0;
    }
    if (op == "$gte") {
      return *cmp >= 0;
    }
    if (op == "$lt") {
      return *cmp < 0;
    }
    return *cmp <= 0;
  }
  if (op == "$in") {
    // Subject is one of the operand's values, or the operand string is a
    // substring of the subject string.
    if (operand.is_array()) {
      return Contains(operand, *subject) ||
             (subject->is_array() && [&] {
               for (const auto &item : subject->as_array()) {
                 if (Contains(operand, item)) {
                   return true;
                 }
               }
               return false;
             }());
    }
    return Contains(*subject, operand);
  }
  if (op == "$nin") {
    return !ApplyOperator("$in", operand, subject);
  }
  if (op == "$startsWith" || op == "$endsWith") {
    if (!subject->is_string() || !operand.is_string()) {
      return false;
    }
    const auto s = AsView(subject->as_string());
    const auto o = AsView(operand.as_string());
    return op == "$startsWith" ? stringutil::starts_with(s, o)
                               : stringutil::ends_with(s, o);
  }
  // Unknown operators never match.
  return false;
}

bool MatchValue(const json::value &predicate, const json::value *subject) {
  if (predicate.is_object()) {
    const auto &pobj = predicate.as_object();
    for (const auto &kv : pobj) {
      const std::string_view key(kv.key().data(), kv.key().size());
      if (!key.empty() && key.front() == '$') {
        if (!ApplyOperator(key, kv.value(), subject)) {
          return false;
        }
        continue;
      }
      const json::value *child = nullptr;
      if (subject && subject->is_object()) {
        child = subject->as_object().if_contains(kv.key());
      }
      if (subject && subject->is_array() && !child) {
        // Object predicate against an array: some element must match the
        // whole remaining key.
        bool any = false;
        for (const auto &item : subject->as_array()) {
          json::object single;
          single[kv.key()] = kv.value();
          if (MatchValue(single, &item)) {
            any = true;
            break;
          }
        }
        if (!any) {
          return false;
        }
        continue;
      }
      if (!MatchValue(kv.value(), child)) {
        return false;
      }
    }
    return true;
  }

  if (subject == nullptr) {
    return false;
  }

  if (predicate.is_array()) {
    if (!subject->is_array()) {
      return false;
    }
    for (const auto &wanted : predicate.as_array()) {
      bool found = false;
      for (const auto &item : subject->as_array()) {
        if (MatchValue(wanted, &item)) {
          found = true;
          break;
        }
      }
      if (!found) {
        return false;
      }
    }
    return true;
  }

  if (subject->is_array()) {
    for (const auto &item : subject->as_array()) {
      if (ScalarEquals(predicate, item)) {
        return true;
      }
    }
    return false;
  }
  return ScalarEquals(predicate, *subject);
}

} // namespace

bool match_filter(const json::value &predicate, const json::value *subject) {
  return MatchValue(predicate, subject);
}

json::value body_subject(const std::string &body) {
  if (body.empty()) {
    return json::value(nullptr);
  }
  boost::system::error_code ec;
  auto parsed = json::parse(body, ec);
  if (ec) {
    return json::value(json::string(body));
  }
  return parsed;
}

json::value headers_subject(const HeaderList &headers) {
  json::object obj;
  for (const auto &[name, value] : headers) {
    const auto key = stringutil::to_lower(name);
    if (auto *existing = obj.if_contains(key); existing && existing->is_string()) {
      std::string joined(existing->as_string().data(),
                         existing->as_string().size());
      joined += ", ";
      joined += value;
      *existing = json::string(joined);
    } else {
      obj[key] = json::string(value);
    }
  }
  return obj;
}

json::value query_subject(const std::string &query) {
  json::object obj;
  std::string_view raw = query;
  if (!raw.empty() && raw.front() == '?') {
    raw.remove_prefix(1);
  }
  if (raw.empty()) {
    return obj;
  }
  auto parsed = urls::parse_query(raw);
  if (!parsed) {
    return obj;
  }
  for (const auto &param : *parsed) {
    std::string key = param.key.decode();
    json::value value = param.has_value ? json::value(json::string(param.value.decode()))
                                        : json::value(true);
    if (auto *existing = obj.if_contains(key)) {
      if (!existing->is_array()) {
        json::array arr;
        arr.push_back(*existing);
        *existing = std::move(arr);
      }
      existing->as_array().push_back(std::move(value));
    } else {
      obj[key] = std::move(value);
    }
  }
  return obj;
}

bool evaluate_session_filters(const InboundEvent &event,
                              const SessionFilters &filters) {
  if (filters.body) {
    const auto subject = body_subject(event.body);
    if (!match_filter(*filters.body, subject.is_null() ? nullptr : &subject)) {
      return false;
    }
  }
  if (filters.headers) {
    const auto subject = headers_subject(event.headers);
    if (!match_filter(*filters.headers, &subject)) {
      return false;
    }
  }
  if (filters.query) {
    const auto subject = query_subject(event.query);
    if (!match_filter(*filters.query, &subject)) {
      return false;
    }
  }
  if (filters.path) {
    const json::value subject = json::string(event.path);
    if (!match_filter(*filters.path, &subject)) {
      return false;
    }
  }
  return true;
}

json::value parse_filter_argument(const std::string &text, const char *flag) {
  boost::system::error_code ec;
  auto parsed = json::parse(text, ec);
  if (ec) {
    throw std::runtime_error(
        fmt::format("{} must be valid JSON: {}", flag, ec.message()));
  }
  return parsed;
}

json::object filters_to_json(const SessionFilters &filters) {
  json::object obj;
  if (filters.body) {
    obj["body"] = *filters.body;
  }
  if (filters.headers) {
    obj["headers"] = *filters.headers;
  }
  if (filters.query) {
    obj["query"] = *filters.query;
  }
  if (filters.path) {
    obj["path"] = *filters.path;
  }
  return obj;
}

} // namespace hookrelay
