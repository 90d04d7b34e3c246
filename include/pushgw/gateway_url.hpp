#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pushgw
{

inline constexpr std::string_view default_gateway = "http://localhost:9091";

// ============================================================================
// Gateway URL
// ============================================================================

struct gateway_url
{
    std::string scheme;                  // lowercase, "http" or "https"
    std::optional<std::string> user;     // percent-decoded
    std::optional<std::string> password; // percent-decoded
    std::string host;                    // without IPv6 brackets
    uint16_t port{0};
    std::string target;                  // path and query, starts with '/'

    [[nodiscard]] bool is_tls() const { return scheme == "https"; }
    [[nodiscard]] bool has_credentials() const { return user.has_value(); }

    /// Host header value; the port is omitted when it is the scheme default.
    [[nodiscard]] std::string host_header() const;

    /// Full URL without credentials.
    [[nodiscard]] std::string to_string() const;
};

/// Parses an absolute http/https URL of the form
/// scheme://[user[:password]@]host[:port][/path][?query]
/// @throws invalid_argument_error "<url> is not a valid URL: <reason>" when the
///         string does not parse; a different message when the scheme is
///         neither http nor https
[[nodiscard]] gateway_url parse_gateway_url(std::string_view url);

} // namespace pushgw
