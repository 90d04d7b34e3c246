#include <pushgw/encoding.hpp>
#include <pushgw/errors.hpp>

// Beast-internal API, checked against Boost 1.74 (the minimum CMake accepts).
// encode(void*, void const*, size_t) -> size_t has been stable since 1.70;
// this is the only library call site.
#include <boost/beast/core/detail/base64.hpp>

#include <fmt/core.h>

#include <algorithm>

namespace pushgw
{

    namespace
    {
        bool is_unreserved(unsigned char c)
        {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                   (c >= '0' && c <= '9') || c == '-' || c == '.' ||
                   c == '_' || c == '~';
        }

        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }
    } // namespace

    std::string url_encode(std::string_view value)
    {
        static constexpr char hex[] = "0123456789ABCDEF";

        std::string encoded;
        encoded.reserve(value.size() * 3);
        for (char ch: value)
        {
            auto c = static_cast<unsigned char>(ch);
            if (is_unreserved(c))
            {
                encoded += ch;
            }
            else
            {
                encoded += '%';
                encoded += hex[c >> 4];
                encoded += hex[c & 0x0F];
            }
        }
        return encoded;
    }

    std::string percent_decode(std::string_view value)
    {
        std::string decoded;
        decoded.reserve(value.size());
        for (std::size_t i = 0; i < value.size(); ++i)
        {
            if (value[i] != '%')
            {
                decoded += value[i];
                continue;
            }
            if (i + 2 >= value.size())
            {
                throw invalid_argument_error(
                  fmt::format("truncated percent escape in '{}'", value)
                );
            }
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi < 0 || lo < 0)
            {
                throw invalid_argument_error(
                  fmt::format("bad percent escape in '{}'", value)
                );
            }
            decoded += static_cast<char>((hi << 4) | lo);
            i += 2;
        }
        return decoded;
    }

    std::string base64_encode(std::string_view value)
    {
        namespace base64 = boost::beast::detail::base64;

        std::string encoded(base64::encoded_size(value.size()), '\0');
        encoded.resize(base64::encode(encoded.data(), value.data(), value.size()));
        return encoded;
    }

    std::string base64url_encode(std::string_view value)
    {
        auto encoded = base64_encode(value);
        std::replace(encoded.begin(), encoded.end(), '+', '-');
        std::replace(encoded.begin(), encoded.end(), '/', '_');
        return encoded;
    }

} // namespace pushgw
