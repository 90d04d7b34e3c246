#include <pushgw/gateway_url.hpp>
#include <pushgw/encoding.hpp>
#include <pushgw/errors.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace pushgw
{

    namespace
    {
        // Internal parse failure, rethrown with the offending URL attached.
        class url_syntax_error : public std::runtime_error
        {
        public:
            using std::runtime_error::runtime_error;
        };

        bool is_scheme_char(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '+' ||
                   c == '-' || c == '.';
        }

        bool is_host_char(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
                   c == '.' || c == '_' || c == '~' || c == '%';
        }

        // RFC 3986 pchar without '%', plus the path and query separators.
        bool is_target_char(char c)
        {
            static constexpr std::string_view extra = "-._~!$&'()*+,;=:@/?";
            return std::isalnum(static_cast<unsigned char>(c)) ||
                   extra.find(c) != std::string_view::npos;
        }

        bool is_hex_digit(char c)
        {
            return std::isxdigit(static_cast<unsigned char>(c)) != 0;
        }

        void check_target(std::string_view target)
        {
            for (std::size_t i = 0; i < target.size(); ++i)
            {
                char c = target[i];
                if (c == '%')
                {
                    if (i + 2 >= target.size() || !is_hex_digit(target[i + 1]) ||
                        !is_hex_digit(target[i + 2]))
                    {
                        throw url_syntax_error("bad percent escape in path");
                    }
                    i += 2;
                }
                else if (!is_target_char(c))
                {
                    throw url_syntax_error(fmt::format(
                      "character 0x{:02X} not allowed in path or query",
                      static_cast<unsigned>(static_cast<unsigned char>(c))
                    ));
                }
            }
        }

        uint16_t default_port(std::string_view scheme)
        {
            return scheme == "https" ? 443 : 80;
        }

        std::string parse_scheme(std::string_view& rest)
        {
            auto colon = rest.find(':');
            if (colon == std::string_view::npos || colon == 0)
                throw url_syntax_error("missing scheme");

            auto raw = rest.substr(0, colon);
            if (!std::isalpha(static_cast<unsigned char>(raw.front())) ||
                !std::all_of(raw.begin(), raw.end(), is_scheme_char))
            {
                throw url_syntax_error(fmt::format("bad scheme '{}'", raw));
            }

            std::string scheme {raw};
            std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });

            rest.remove_prefix(colon + 1);
            return scheme;
        }

        uint16_t parse_port(std::string_view digits)
        {
            unsigned value = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
            if (ec != std::errc {} || ptr != digits.data() + digits.size() || value == 0 ||
                value > 65535)
            {
                throw url_syntax_error(fmt::format("bad port '{}'", digits));
            }
            return static_cast<uint16_t>(value);
        }

        void parse_authority(std::string_view authority, gateway_url& url)
        {
            auto at = authority.rfind('@');
            if (at != std::string_view::npos)
            {
                auto userinfo = authority.substr(0, at);
                auto colon = userinfo.find(':');
                url.user = percent_decode(userinfo.substr(0, colon));
                if (colon != std::string_view::npos)
                    url.password = percent_decode(userinfo.substr(colon + 1));
                else
                    url.password = std::string {};
                authority.remove_prefix(at + 1);
            }

            std::string_view port;
            if (!authority.empty() && authority.front() == '[')
            {
                auto close = authority.find(']');
                if (close == std::string_view::npos)
                    throw url_syntax_error("unterminated IPv6 address");
                url.host = std::string {authority.substr(1, close - 1)};
                auto tail = authority.substr(close + 1);
                if (!tail.empty())
                {
                    if (tail.front() != ':')
                        throw url_syntax_error("unexpected characters after IPv6 address");
                    port = tail.substr(1);
                }
            }
            else
            {
                auto colon = authority.rfind(':');
                url.host = std::string {authority.substr(0, colon)};
                if (colon != std::string_view::npos)
                    port = authority.substr(colon + 1);
                if (!std::all_of(url.host.begin(), url.host.end(), is_host_char))
                    throw url_syntax_error(fmt::format("bad host '{}'", url.host));
            }

            if (url.host.empty())
                throw url_syntax_error("missing host");

            url.port = port.empty() ? default_port(url.scheme) : parse_port(port);
        }
    } // namespace

    std::string gateway_url::host_header() const
    {
        std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        if (port != default_port(scheme))
            h += ":" + std::to_string(port);
        return h;
    }

    std::string gateway_url::to_string() const
    {
        return scheme + "://" + host_header() + target;
    }

    gateway_url parse_gateway_url(std::string_view url)
    {
        gateway_url result;
        std::string_view rest = url;

        try
        {
            result.scheme = parse_scheme(rest);
        }
        catch (const url_syntax_error& e)
        {
            throw invalid_argument_error(
              fmt::format("{} is not a valid URL: {}", url, e.what())
            );
        }

        if (result.scheme != "http" && result.scheme != "https")
        {
            throw invalid_argument_error(
              "only HTTP gateway URLs are supported currently."
            );
        }

        try
        {
            if (rest.substr(0, 2) != "//")
                throw url_syntax_error("missing '//' after scheme");
            rest.remove_prefix(2);

            auto authority_end = rest.find_first_of("/?#");
            parse_authority(rest.substr(0, authority_end), result);

            std::string_view target;
            if (authority_end != std::string_view::npos)
                target = rest.substr(authority_end);

            // '#' is outside the allowed set: fragments are rejected.
            check_target(target);

            if (target.empty() || target.front() != '/')
                result.target = "/" + std::string {target};
            else
                result.target = std::string {target};
        }
        catch (const std::runtime_error& e)
        {
            // url_syntax_error, or a bad escape in the credentials
            throw invalid_argument_error(
              fmt::format("{} is not a valid URL: {}", url, e.what())
            );
        }

        return result;
    }

} // namespace pushgw
