#include <pushgw/pushgw.h>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

#include <chrono>
#include <iostream>
#include <thread>

using namespace pushgw;

int main(int argc, char** argv)
{
    std::cout << "=== Pushgateway Example ===\n\n";

    Logger::instance().set_level(LogLevel::Debug);

    push_config config;
    config.job          = "pushgw_example";
    config.gateway      = argc > 1 ? argv[1] : std::string {default_gateway};
    config.grouping     = instance_grouping_key("example-host");
    config.open_timeout = std::chrono::seconds(2);
    config.read_timeout = std::chrono::seconds(5);

    prometheus::Registry registry;
    auto& processed = prometheus::BuildCounter()
                        .Name("example_items_processed_total")
                        .Help("Items processed by this run")
                        .Register(registry)
                        .Add({{"stage", "transform"}});
    auto& last_success = prometheus::BuildGauge()
                           .Name("example_last_success_timestamp_seconds")
                           .Help("Unix time of the last successful run")
                           .Register(registry)
                           .Add({});

    try
    {
        push_client client {config};
        std::cout << "Pushing to " << client.url().to_string() << "\n";

        for (int i = 0; i < 5; ++i)
        {
            processed.Increment(10);
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        last_success.SetToCurrentTime();

        auto response = client.add(registry);
        std::cout << "✓ add: " << response.status << "\n";

        response = client.replace(registry);
        std::cout << "✓ replace: " << response.status << "\n";

        response = client.remove();
        std::cout << "✓ delete: " << response.status << "\n";
    }
    catch (const http_error& e)
    {
        std::cerr << "Gateway rejected the push (" << to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    }
    catch (const push_error& e)
    {
        std::cerr << "Push failed (" << to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    }
    catch (const boost::system::system_error& e)
    {
        std::cerr << "Network error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
