#include <pushgw/path_builder.hpp>

namespace pushgw
{

    std::string build_path(std::string_view job, const grouping_key& grouping)
    {
        std::string path {job_path_prefix};
        path += url_encode(job);

        for (const auto& [label, value]: grouping)
        {
            path += '/';
            path += label;
            if (value.find('/') != std::string::npos)
            {
                path += "@base64/";
                path += base64url_encode(value);
            }
            else if (value.empty())
            {
                // "//" may be collapsed by proxies, so a lone padding
                // character stands in for the empty value.
                path += "@base64/=";
            }
            else
            {
                path += '/';
                path += url_encode(value);
            }
        }

        return path;
    }

} // namespace pushgw
