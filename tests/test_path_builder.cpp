#include <pushgw/encoding.hpp>
#include <pushgw/path_builder.hpp>

#include <boost/beast/core/detail/base64.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <string_view>

using namespace pushgw;

namespace
{
    std::string base64url_decode(std::string value)
    {
        namespace base64 = boost::beast::detail::base64;

        std::replace(value.begin(), value.end(), '-', '+');
        std::replace(value.begin(), value.end(), '_', '/');
        std::string decoded(base64::decoded_size(value.size()), '\0');
        auto result = base64::decode(decoded.data(), value.data(), value.size());
        decoded.resize(result.first);
        return decoded;
    }

    // Last path segment, the encoded value of the final grouping-key entry.
    std::string last_segment(const std::string& path)
    {
        return path.substr(path.rfind('/') + 1);
    }
} // namespace

TEST(UrlEncode, KeepsUnreservedCharacters)
{
    EXPECT_EQ(url_encode("abcXYZ019-._~"), "abcXYZ019-._~");
}

TEST(UrlEncode, EscapesEverythingElse)
{
    EXPECT_EQ(url_encode("a b"), "a%20b");
    EXPECT_EQ(url_encode("foo/bar"), "foo%2Fbar");
    EXPECT_EQ(url_encode("a+b&c=d"), "a%2Bb%26c%3Dd");
    EXPECT_EQ(url_encode("\xC3\xA9"), "%C3%A9");
}

TEST(Base64Url, UsesUrlSafeAlphabetWithPadding)
{
    EXPECT_EQ(base64_encode("\xfb\xff"), "+/8=");
    EXPECT_EQ(base64url_encode("\xfb\xff"), "-_8=");
    EXPECT_EQ(base64url_encode("a"), "YQ==");
    EXPECT_EQ(base64url_encode(""), "");
}

TEST(Base64Url, MatchesRfc4648Vectors)
{
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foob"), "Zm9vYg==");
    EXPECT_EQ(base64_encode("fooba"), "Zm9vYmE=");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
    EXPECT_EQ(base64_encode(std::string_view {"\0\0\0", 3}), "AAAA");
}

TEST(BuildPath, JobOnly)
{
    EXPECT_EQ(build_path("batch", {}), "/metrics/job/batch");
}

TEST(BuildPath, JobIsPercentEncoded)
{
    EXPECT_EQ(build_path("my job/1", {}), "/metrics/job/my%20job%2F1");
}

TEST(BuildPath, PlainValuesArePercentEncoded)
{
    EXPECT_EQ(build_path("batch", {{"instance", "host 1"}}),
              "/metrics/job/batch/instance/host%201");
}

TEST(BuildPath, ValueWithSlashUsesBase64Form)
{
    auto path = build_path("batch", {{"path", "/var/tmp"}});
    EXPECT_EQ(path, "/metrics/job/batch/path@base64/L3Zhci90bXA=");
    EXPECT_EQ(base64url_decode(last_segment(path)), "/var/tmp");
}

TEST(BuildPath, EmptyValueBecomesSinglePaddingCharacter)
{
    auto path = build_path("batch", {{"instance", ""}});
    EXPECT_EQ(path, "/metrics/job/batch/instance@base64/=");
    EXPECT_EQ(path.find("//"), std::string::npos);
    EXPECT_EQ(path.find("instance/"), std::string::npos);
}

TEST(BuildPath, SlashValuesRoundTrip)
{
    for (const std::string value: {"/", "a/b", "//", "x/y/z?&=", "\xC3\xA9/\xE2\x82\xAC", "ends/"})
    {
        auto path = build_path("j", {{"k", value}});
        ASSERT_NE(path.find("/k@base64/"), std::string::npos) << value;
        EXPECT_EQ(base64url_decode(last_segment(path)), value);
    }
}

TEST(BuildPath, PlainValuesRoundTrip)
{
    for (const std::string value: {"plain", "with space", "a+b", "100%", "\xC3\xA9t\xC3\xA9", "@base64"})
    {
        auto path = build_path("j", {{"k", value}});
        ASSERT_EQ(path.rfind("/metrics/job/j/k/", 0), 0u) << value;
        EXPECT_EQ(percent_decode(last_segment(path)), value);
    }
}

TEST(BuildPath, MultipleLabelsInKeyOrder)
{
    grouping_key key {{"zone", "eu"}, {"instance", "a/b"}, {"empty", ""}};
    EXPECT_EQ(build_path("batch", key),
              "/metrics/job/batch/empty@base64/=/instance@base64/YS9i/zone/eu");
}

TEST(BuildPath, Deterministic)
{
    grouping_key key {{"instance", "x"}, {"path", "/a"}, {"team", ""}};
    EXPECT_EQ(build_path("batch", key), build_path("batch", key));
    EXPECT_EQ(build_path("batch", key), build_path("batch", grouping_key(key.rbegin(), key.rend())));
}
