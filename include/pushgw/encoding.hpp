#pragma once

#include <string>
#include <string_view>

namespace pushgw
{

/// Percent-encodes every byte outside the RFC 3986 unreserved set
/// (A-Z a-z 0-9 - . _ ~), using uppercase hex digits.
[[nodiscard]] std::string url_encode(std::string_view value);

/// Reverses %XX escapes.
/// @throws invalid_argument_error on a truncated or non-hex escape
[[nodiscard]] std::string percent_decode(std::string_view value);

/// Padded base64, standard alphabet.
[[nodiscard]] std::string base64_encode(std::string_view value);

/// Padded base64 with the URL-safe alphabet ('-' and '_' for '+' and '/').
[[nodiscard]] std::string base64url_encode(std::string_view value);

} // namespace pushgw
