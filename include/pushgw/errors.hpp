#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace pushgw
{

// ============================================================================
// Error kinds
// ============================================================================

enum class error_kind
{
    invalid_argument,
    invalid_label_set,
    label_collision,
    http_redirect,
    http_client_error,
    http_server_error
};

[[nodiscard]] std::string_view to_string(error_kind kind) noexcept;

// ============================================================================
// Exception hierarchy
// ============================================================================

/// Base of every error raised by pushgw itself.
/// Transport failures are not wrapped and surface as boost::system::system_error.
class push_error : public std::runtime_error
{
public:
    push_error(error_kind kind, const std::string& message)
      : std::runtime_error(message)
      , kind_{kind}
    {
    }

    [[nodiscard]] error_kind kind() const noexcept { return kind_; }

private:
    error_kind kind_;
};

/// Empty job, or a gateway URL that is malformed or not http/https.
class invalid_argument_error : public push_error
{
public:
    explicit invalid_argument_error(const std::string& message)
      : push_error(error_kind::invalid_argument, message)
    {
    }
};

/// Grouping-key label name is malformed or reserved.
class invalid_label_set_error : public push_error
{
public:
    explicit invalid_label_set_error(const std::string& message)
      : push_error(error_kind::invalid_label_set, message)
    {
    }

protected:
    invalid_label_set_error(error_kind kind, const std::string& message)
      : push_error(kind, message)
    {
    }
};

/// A grouping-key label is also used by a pushed metric and would overwrite it.
class label_collision_error : public invalid_label_set_error
{
public:
    label_collision_error(std::string label, std::string metric);

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    [[nodiscard]] const std::string& metric() const noexcept { return metric_; }

private:
    std::string label_;
    std::string metric_;
};

/// Gateway answered with a non-success status.
class http_error : public push_error
{
public:
    http_error(error_kind kind, unsigned status, std::string reason, std::string body);

    [[nodiscard]] unsigned status() const noexcept { return status_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }
    [[nodiscard]] const std::string& body() const noexcept { return body_; }

private:
    unsigned status_;
    std::string reason_;
    std::string body_;
};

class http_redirect_error : public http_error
{
public:
    http_redirect_error(unsigned status, std::string reason, std::string body)
      : http_error(error_kind::http_redirect, status, std::move(reason), std::move(body))
    {
    }
};

class http_client_error : public http_error
{
public:
    http_client_error(unsigned status, std::string reason, std::string body)
      : http_error(error_kind::http_client_error, status, std::move(reason), std::move(body))
    {
    }
};

class http_server_error : public http_error
{
public:
    http_server_error(unsigned status, std::string reason, std::string body)
      : http_error(error_kind::http_server_error, status, std::move(reason), std::move(body))
    {
    }
};

} // namespace pushgw
