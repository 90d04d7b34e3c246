#pragma once

#include <boost/beast/http/verb.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace pushgw::http
{

using verb = boost::beast::http::verb;

// ============================================================================
// Request / Response
// ============================================================================

struct request
{
    verb method{verb::get};
    std::string target;                        // origin-form, e.g. "/metrics/job/batch"
    std::map<std::string, std::string> headers;
    std::optional<std::string> body;
};

struct response
{
    unsigned status{0};
    std::string reason;
    std::string body;
    // Field names as the server sent them; repeated fields are joined with ", ".
    std::map<std::string, std::string> headers;
};

// ============================================================================
// Transport Configuration
// ============================================================================

struct transport_config
{
    std::string host;
    uint16_t port{80};
    bool use_tls{false};

    // Connect (resolve + TCP + TLS handshake) deadline.
    std::chrono::milliseconds open_timeout{std::chrono::seconds{60}};
    // Deadline for writing one request and reading its response.
    std::chrono::milliseconds read_timeout{std::chrono::seconds{60}};

    bool is_valid() const
    {
        return !host.empty() && port > 0 &&
               open_timeout.count() > 0 &&
               read_timeout.count() > 0;
    }
};

// ============================================================================
// Transport Interface
// ============================================================================

/// Sends one request and returns the response. Implementations are used by a
/// single caller at a time. Network failures are reported by throwing
/// boost::system::system_error.
class transport
{
public:
    virtual ~transport() = default;

    virtual response perform(const request& req) = 0;
};

} // namespace pushgw::http
