#pragma once

#include <prometheus/metric_family.h>

#include <string>
#include <vector>

namespace pushgw
{

// ============================================================================
// Serializer Interface
// ============================================================================

class serializer
{
public:
    virtual ~serializer() = default;

    /// Value sent in the Content-Type header alongside the payload.
    [[nodiscard]] virtual std::string content_type() const = 0;

    [[nodiscard]] virtual std::string marshal(const std::vector<prometheus::MetricFamily>& families) const = 0;
};

// ============================================================================
// Built-in Implementations
// ============================================================================

/// Prometheus text exposition format, version 0.0.4.
class text_serializer : public serializer
{
public:
    static constexpr const char* content_type_value = "text/plain; version=0.0.4; charset=utf-8";

    [[nodiscard]] std::string content_type() const override;
    [[nodiscard]] std::string marshal(const std::vector<prometheus::MetricFamily>& families) const override;
};

} // namespace pushgw
