#pragma once

#include <boost/url/encode.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>

#include <string>
#include <string_view>

namespace matrixforge::util {

/// Percent-encodes everything outside RFC 3986 unreserved characters, which
/// keeps the result safe as a single path component.
[[nodiscard]] inline auto url_encode(std::string_view input) -> std::string {
  return boost::urls::encode(input, boost::urls::unreserved_chars);
}

} // namespace matrixforge::util
