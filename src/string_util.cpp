#include "util/string_util.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace hookrelay {
namespace stringutil {

std::string to_lower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() &&
         value.substr(value.size() - suffix.size()) == suffix;
}

bool istarts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         iequals(value.substr(0, prefix.size()), prefix);
}

std::string trim(std::string_view value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return std::string(value.substr(first, last - first + 1));
}

std::vector<std::string> split(std::string_view value, char sep) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (start <= value.size()) {
    const auto pos = value.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(value.substr(start));
      break;
    }
    parts.emplace_back(value.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

bool is_valid_utf8(std::string_view data) {
  std::size_t i = 0;
  const std::size_t n = data.size();
  while (i < n) {
    const auto c = static_cast<std::uint8_t>(data[i]);
    if (c < 0x80) {
      ++i;
      continue;
    }
    std::size_t len = 0;
    std::uint32_t cp = 0;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + len > n) {
      return false;
    }
    for (std::size_t k = 1; k < len; ++k) {
      const auto cc = static_cast<std::uint8_t>(data[i + k]);
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
        (len == 4 && cp < 0x10000)) {
      return false; // overlong
    }
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += len;
  }
  return true;
}

std::string base64_encode(std::string_view data) {
  if (data.empty()) {
    return {};
  }
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  const int written = EVP_EncodeBlock(
      reinterpret_cast<unsigned char *>(out.data()),
      reinterpret_cast<const unsigned char *>(data.data()),
      static_cast<int>(data.size()));
  out.resize(static_cast<std::size_t>(std::max(0, written)));
  return out;
}

std::optional<std::string> base64_decode(std::string_view encoded) {
  if (encoded.empty()) {
    return std::string{};
  }
  if (encoded.size() % 4 != 0) {
    return std::nullopt;
  }
  std::string out(3 * (encoded.size() / 4), '\0');
  const int written = EVP_DecodeBlock(
      reinterpret_cast<unsigned char *>(out.data()),
      reinterpret_cast<const unsigned char *>(encoded.data()),
      static_cast<int>(encoded.size()));
  if (written < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock counts padding as zero bytes.
  std::size_t padding = 0;
  if (encoded.back() == '=') {
    ++padding;
    if (encoded[encoded.size() - 2] == '=') {
      ++padding;
    }
  }
  out.resize(static_cast<std::size_t>(written) - padding);
  return out;
}

} // namespace stringutil
} // namespace hookrelay
