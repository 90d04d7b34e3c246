#include <pushgw/response_classifier.hpp>
#include <pushgw/errors.hpp>

namespace pushgw
{

    void validate_response(const http::response& response)
    {
        const auto status = response.status;
        if (status < 300)
            return;

        if (status <= 399)
            throw http_redirect_error(status, response.reason, response.body);
        if (status <= 499)
            throw http_client_error(status, response.reason, response.body);
        throw http_server_error(status, response.reason, response.body);
    }

} // namespace pushgw
