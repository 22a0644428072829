#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hookrelay {
namespace stringutil {

std::string to_lower(std::string value);

bool iequals(std::string_view a, std::string_view b);

bool starts_with(std::string_view value, std::string_view prefix);

bool ends_with(std::string_view value, std::string_view suffix);

// Case-insensitive prefix test, for header names.
bool istarts_with(std::string_view value, std::string_view prefix);

std::string trim(std::string_view value);

std::vector<std::string> split(std::string_view value, char sep);

// Strict UTF-8 validation: rejects overlong forms, surrogates and code
// points above U+10FFFF.
bool is_valid_utf8(std::string_view data);

// Standard alphabet with padding.
std::string base64_encode(std::string_view data);

// Returns nullopt for malformed input. Whitespace is not tolerated.
std::optional<std::string> base64_decode(std::string_view encoded);

} // namespace stringutil
} // namespace hookrelay
