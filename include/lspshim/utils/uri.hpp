#pragma once

#include <charconv>
#include <cstdio>
#include <string>
#include <string_view>

namespace lspshim::utils {

// Check if the URI starts with file://
inline auto IsFileUri(std::string_view uri) -> bool {
  return uri.substr(0, 7) == "file://";
}

// Convert URI to local file path
// Examples:
// "file:///home/user/script.nu" -> "/home/user/script.nu"
// "file:///home/user/my%20dir/a.nu" -> "/home/user/my dir/a.nu"
inline auto UriToPath(std::string_view uri) -> std::string {
  if (!IsFileUri(uri)) {
    return std::string(uri);
  }

  // Remove the file:// prefix
  std::string_view path = uri.substr(7);

  // Decode %XX escapes, leaving malformed ones as they are
  std::string result;
  result.reserve(path.size());
  for (std::size_t i = 0; i < path.size(); ++i) {
    if (path[i] == '%' && i + 2 < path.size()) {
      unsigned int value = 0;
      const auto* first = path.data() + i + 1;
      auto [ptr, ec] = std::from_chars(first, first + 2, value, 16);
      if (ec == std::errc() && ptr == first + 2) {
        result += static_cast<char>(value);
        i += 2;
        continue;
      }
    }
    result += path[i];
  }
  return result;
}

// Convert local file path to URI
// Examples:
// "/home/user/script.nu" -> "file:///home/user/script.nu"
inline auto PathToUri(std::string_view path) -> std::string {
  std::string result = "file://";

  // Encode special characters
  for (char c : path) {
    if (c == ' ' || c == '%' || c == '#' || c == '?' ||
        static_cast<unsigned char>(c) > 127 ||
        static_cast<unsigned char>(c) < 32) {
      char hex[4];
      std::snprintf(hex, sizeof(hex), "%%%02X", static_cast<unsigned char>(c));
      result += hex;
    } else {
      result += c;
    }
  }

  return result;
}

}  // namespace lspshim::utils
