#include <pushgw/errors.hpp>

#include <fmt/core.h>

namespace pushgw
{

    std::string_view to_string(error_kind kind) noexcept
    {
        switch (kind)
        {
            case error_kind::invalid_argument:
                return "invalid_argument";
            case error_kind::invalid_label_set:
                return "invalid_label_set";
            case error_kind::label_collision:
                return "label_collision";
            case error_kind::http_redirect:
                return "http_redirect";
            case error_kind::http_client_error:
                return "http_client_error";
            case error_kind::http_server_error:
                return "http_server_error";
        }
        return "unknown";
    }

    label_collision_error::label_collision_error(
      std::string label, std::string metric
    )
      : invalid_label_set_error(
          error_kind::label_collision,
          fmt::format(
            "label '{}' from grouping key collides with label of the same "
            "name from metric '{}' and would overwrite it",
            label,
            metric
          )
        )
      , label_ {std::move(label)}
      , metric_ {std::move(metric)}
    {
    }

    http_error::http_error(
      error_kind kind, unsigned status, std::string reason, std::string body
    )
      : push_error(
          kind,
          fmt::format("status: {}, message: {}, body: {}", status, reason, body)
        )
      , status_ {status}
      , reason_ {std::move(reason)}
      , body_ {std::move(body)}
    {
    }

} // namespace pushgw
