#pragma once

#include <pushgw/http/transport.hpp>

namespace pushgw
{

/// Maps the gateway's status code onto success or one of the http_error
/// subclasses: 3xx http_redirect_error, 4xx http_client_error,
/// 5xx and above http_server_error. Anything below 300 passes through.
void validate_response(const http::response& response);

} // namespace pushgw
