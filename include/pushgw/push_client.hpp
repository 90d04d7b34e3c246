#pragma once

#include <pushgw/gateway_url.hpp>
#include <pushgw/http/transport.hpp>
#include <pushgw/path_builder.hpp>
#include <pushgw/serializer.hpp>

#include <prometheus/collectable.h>
#include <prometheus/metric_family.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pushgw
{

// ============================================================================
// Push Configuration
// ============================================================================

struct push_config
{
    std::string job;
    std::string gateway{default_gateway};
    grouping_key grouping;

    // Unset keeps the transport defaults.
    std::optional<std::chrono::milliseconds> open_timeout;
    std::optional<std::chrono::milliseconds> read_timeout;

    bool is_valid() const
    {
        return !job.empty() &&
               (!open_timeout || open_timeout->count() > 0) &&
               (!read_timeout || read_timeout->count() > 0);
    }
};

/// {"instance": hostname}, or an empty key for an empty hostname.
[[nodiscard]] grouping_key instance_grouping_key(const std::string& hostname);

// ============================================================================
// Push Client
// ============================================================================

/// Pushes registry snapshots to a Pushgateway under one job and grouping key.
///
/// Calls block until the gateway answers. Calls on the same instance are
/// serialized, so at most one request is in flight per client. Failures are
/// thrown: push_error subclasses for validation and HTTP status errors,
/// boost::system::system_error for network errors.
class push_client
{
public:
    /// @throws invalid_argument_error for an empty job or an unusable gateway URL
    /// @throws invalid_label_set_error for a bad grouping-key label name
    explicit push_client(push_config config);

    /// Same as above with an injected transport and serializer.
    /// A null argument selects the default implementation.
    push_client(push_config config,
                std::unique_ptr<http::transport> transport,
                std::shared_ptr<const serializer> payload_serializer);

    push_client(const push_client&) = delete;
    push_client& operator=(const push_client&) = delete;
    push_client(push_client&&) = delete;
    push_client& operator=(push_client&&) = delete;
    ~push_client();

    /// Merges the registry's metrics into the gateway's group (POST).
    http::response add(const prometheus::Collectable& registry);

    /// Replaces the gateway's group with the registry's metrics (PUT).
    http::response replace(const prometheus::Collectable& registry);

    /// Deletes the gateway's group (DELETE).
    http::response remove();

    [[nodiscard]] const std::string& job() const { return job_; }
    [[nodiscard]] const std::string& gateway() const { return gateway_; }
    [[nodiscard]] const grouping_key& grouping() const { return grouping_; }
    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] const gateway_url& url() const { return url_; }

private:
    http::response push(http::verb method, const prometheus::Collectable& registry);
    http::response send(http::verb method, std::optional<std::string> payload);

    void validate_no_label_clashes(const std::vector<prometheus::MetricFamily>& families) const;

    std::string job_;
    std::string gateway_;
    grouping_key grouping_;
    std::string path_;
    gateway_url url_;
    std::optional<std::string> authorization_;

    std::shared_ptr<const serializer> serializer_;

    std::mutex mutex_;
    std::unique_ptr<http::transport> transport_;
};

} // namespace pushgw
