#include <pushgw/serializer.hpp>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

#include <gtest/gtest.h>

using namespace pushgw;

TEST(TextSerializer, ContentType)
{
    EXPECT_EQ(text_serializer {}.content_type(), "text/plain; version=0.0.4; charset=utf-8");
}

TEST(TextSerializer, MarshalsRegistry)
{
    prometheus::Registry registry;
    auto& family = prometheus::BuildCounter()
                     .Name("jobs_processed_total")
                     .Help("Jobs processed")
                     .Register(registry);
    family.Add({{"queue", "default"}}).Increment(3);

    auto payload = text_serializer {}.marshal(registry.Collect());

    EXPECT_NE(payload.find("# HELP jobs_processed_total Jobs processed"), std::string::npos);
    EXPECT_NE(payload.find("# TYPE jobs_processed_total counter"), std::string::npos);
    EXPECT_NE(payload.find("jobs_processed_total{queue=\"default\"} "), std::string::npos);
}

TEST(TextSerializer, EmptyRegistry)
{
    prometheus::Registry registry;
    EXPECT_TRUE(text_serializer {}.marshal(registry.Collect()).empty());
}
