#include <pushgw/push_client.hpp>
#include <pushgw/errors.hpp>
#include <pushgw/http/beast_transport.hpp>
#include <pushgw/label_validator.hpp>
#include <pushgw/logger.h>
#include <pushgw/response_classifier.hpp>

#include <fmt/core.h>

#include <set>

namespace pushgw
{

    namespace
    {
        std::string strip_trailing_slashes(std::string gateway)
        {
            while (!gateway.empty() && gateway.back() == '/')
                gateway.pop_back();
            return gateway;
        }

        std::unique_ptr<http::transport> make_default_transport(
          const gateway_url& url, const push_config& config
        )
        {
            http::transport_config transport_config;
            transport_config.host    = url.host;
            transport_config.port    = url.port;
            transport_config.use_tls = url.is_tls();
            if (config.open_timeout)
                transport_config.open_timeout = *config.open_timeout;
            if (config.read_timeout)
                transport_config.read_timeout = *config.read_timeout;

            return std::make_unique<http::beast_transport>(std::move(transport_config));
        }
    } // namespace

    grouping_key instance_grouping_key(const std::string& hostname)
    {
        if (hostname.empty())
            return {};
        return {{"instance", hostname}};
    }

    push_client::push_client(push_config config)
      : push_client(std::move(config), nullptr, nullptr)
    {
    }

    push_client::push_client(
      push_config config,
      std::unique_ptr<http::transport> transport,
      std::shared_ptr<const serializer> payload_serializer
    )
    {
        if (config.job.empty())
        {
            throw invalid_argument_error("job cannot be empty");
        }
        if (!config.is_valid())
        {
            throw invalid_argument_error("timeouts must be positive");
        }

        label_validator {}.validate_symbols(config.grouping);

        job_      = std::move(config.job);
        gateway_  = config.gateway.empty() ? std::string {default_gateway} : config.gateway;
        grouping_ = std::move(config.grouping);
        path_     = build_path(job_, grouping_);
        url_      = parse_gateway_url(strip_trailing_slashes(gateway_) + path_);

        // The derived path never contains '?', so a query can only come from
        // the gateway.
        if (url_.target.find('?') != std::string::npos)
        {
            throw invalid_argument_error(fmt::format(
              "{} is not a valid URL: a gateway URL cannot carry a query", gateway_
            ));
        }

        if (url_.has_credentials())
        {
            authorization_ = "Basic " + base64_encode(*url_.user + ":" + url_.password.value_or(""));
        }

        serializer_ = std::move(payload_serializer);
        if (!serializer_)
            serializer_ = std::make_shared<text_serializer>();

        transport_ = std::move(transport);
        if (!transport_)
            transport_ = make_default_transport(url_, config);

        PUSHGW_LOG_DEBUG("push client for job '{}' targets {}", job_, url_.to_string());
    }

    push_client::~push_client() = default;

    http::response push_client::add(const prometheus::Collectable& registry)
    {
        return push(http::verb::post, registry);
    }

    http::response push_client::replace(const prometheus::Collectable& registry)
    {
        return push(http::verb::put, registry);
    }

    http::response push_client::remove()
    {
        return send(http::verb::delete_, std::nullopt);
    }

    http::response push_client::push(
      http::verb method, const prometheus::Collectable& registry
    )
    {
        // One snapshot is both validated and sent.
        auto families = registry.Collect();
        validate_no_label_clashes(families);
        return send(method, serializer_->marshal(families));
    }

    http::response push_client::send(
      http::verb method, std::optional<std::string> payload
    )
    {
        std::lock_guard<std::mutex> lock(mutex_);

        http::request req;
        req.method = method;
        req.target = url_.target;
        if (payload)
        {
            req.headers["Content-Type"] = serializer_->content_type();
            req.body                    = std::move(payload);
        }
        if (authorization_)
        {
            req.headers["Authorization"] = *authorization_;
        }

        auto response = transport_->perform(req);
        validate_response(response);
        return response;
    }

    void push_client::validate_no_label_clashes(
      const std::vector<prometheus::MetricFamily>& families
    ) const
    {
        if (grouping_.empty())
            return;

        std::set<std::string> grouping_labels;
        for (const auto& [label, value]: grouping_)
        {
            (void) value;
            grouping_labels.insert(label);
        }

        for (const auto& family: families)
        {
            for (const auto& metric: family.metric)
            {
                for (const auto& label: metric.label)
                {
                    if (grouping_labels.count(label.name))
                    {
                        throw label_collision_error(label.name, family.name);
                    }
                }
            }
        }
    }

} // namespace pushgw
