#pragma once

#include <boost/json.hpp>

#include <functional>
#include <string>

#include "listen/listen_types.hpp"

namespace hookrelay {

// Pure predicate evaluator: same event and filters always give the same
// answer, and nothing outside the arguments is read.
using FilterEvaluator =
    std::function<bool(const InboundEvent &, const SessionFilters &)>;

// Matches one predicate against a JSON subject (nullptr when the subject is
// absent). Objects match as subsets, scalars by equality, and an array
// subject matches a scalar predicate when any element does. Operators:
// $eq $neq $gt $gte $lt $lte $in $nin $startsWith $endsWith $exist $or
// $and $not.
bool match_filter(const boost::json::value &predicate,
                  const boost::json::value *subject);

// Subject views used by the default evaluator.
boost::json::value body_subject(const std::string &body);
boost::json::value headers_subject(const HeaderList &headers);
boost::json::value query_subject(const std::string &query);

// Default evaluator: every present predicate must match.
bool evaluate_session_filters(const InboundEvent &event,
                              const SessionFilters &filters);

// Parses a --filter-* argument; throws std::runtime_error on bad JSON.
boost::json::value parse_filter_argument(const std::string &text,
                                         const char *flag);

boost::json::object filters_to_json(const SessionFilters &filters);

} // namespace hookrelay
