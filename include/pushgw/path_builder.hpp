#pragma once

#include <pushgw/encoding.hpp>

#include <map>
#include <string>
#include <string_view>

namespace pushgw
{

using grouping_key = std::map<std::string, std::string>;

inline constexpr std::string_view job_path_prefix = "/metrics/job/";

/// Builds "/metrics/job/<job>" followed by one segment pair per grouping-key
/// entry. Values containing '/' use the "<label>@base64/<value>" form, empty
/// values become "<label>@base64/=" so no empty path segment is produced.
[[nodiscard]] std::string build_path(std::string_view job, const grouping_key& grouping);

} // namespace pushgw
