#pragma once

#include <string>

#include "listen/listen_types.hpp"
#include "result.hpp"

namespace hookrelay {

// Builds the forwarding target from the first `listen` positional:
//   "3000"                   -> http://localhost:3000
//   "https://app.test/hooks" -> as given
//   "app.test:8080/hooks"    -> http://app.test:8080/hooks
// A host is required and a query string is rejected. Errors carry
// GENERAL::INVALID_ARGUMENT.
Result<ForwardTarget> parse_forward_target(const std::string &arg,
                                           const std::string &cli_path = {});

// Accepts "/", "/a/b", "//x"; rejects empty strings, relative paths and
// characters outside the URL path set.
bool is_valid_cli_path(const std::string &path);

} // namespace hookrelay
