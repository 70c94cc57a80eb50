#ifndef FILEURL_HPP
#define FILEURL_HPP

#include <cctype>
#include <cstdio>
#include <optional>
#include <string>

/**
 * @brief Conversion between local paths and file:// URLs
 *
 * Only the "file" scheme with an empty or "localhost" authority is
 * accepted. Path bytes outside the unreserved set are percent-encoded.
 *
 * @code
 * FileUrl::fromPath("/tmp/a b")          // "file:///tmp/a%20b"
 * FileUrl::toPath("file:///tmp/a%20b")   // "/tmp/a b"
 * FileUrl::toPath("https://example.org") // std::nullopt
 * @endcode
 */
class FileUrl {
public:
  static std::string fromPath(const std::string &path) {
    std::string url = "file://";
    for (unsigned char c : path) {
      if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' ||
          c == '~') {
        url += static_cast<char>(c);
      } else {
        char buf[4];
        std::snprintf(buf, sizeof(buf), "%%%02X", c);
        url += buf;
      }
    }
    return url;
  }

  static std::optional<std::string> toPath(const std::string &url) {
    const std::string scheme = "file://";
    if (url.size() < scheme.size())
      return std::nullopt;
    for (size_t i = 0; i < scheme.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(url[i])) != scheme[i])
        return std::nullopt;
    }

    std::string rest = url.substr(scheme.size());
    const std::string localhost = "localhost";
    if (rest.compare(0, localhost.size(), localhost) == 0) {
      rest.erase(0, localhost.size());
    }
    if (rest.empty() || rest[0] != '/')
      return std::nullopt;

    // Query and fragment are not part of the path
    auto cut = rest.find_first_of("?#");
    if (cut != std::string::npos)
      rest.erase(cut);

    std::string path;
    for (size_t i = 0; i < rest.size(); ++i) {
      if (rest[i] == '%') {
        if (i + 2 >= rest.size() || !std::isxdigit(static_cast<unsigned char>(rest[i + 1])) ||
            !std::isxdigit(static_cast<unsigned char>(rest[i + 2])))
          return std::nullopt;
        path += static_cast<char>(std::stoi(rest.substr(i + 1, 2), nullptr, 16));
        i += 2;
      } else {
        path += rest[i];
      }
    }
    return path;
  }
};

#endif // FILEURL_HPP
