#include <pushgw/serializer.hpp>

#include <prometheus/text_serializer.h>

#include <sstream>

namespace pushgw
{

    std::string text_serializer::content_type() const
    {
        return content_type_value;
    }

    std::string text_serializer::marshal(
      const std::vector<prometheus::MetricFamily>& families
    ) const
    {
        std::ostringstream out;
        prometheus::TextSerializer {}.Serialize(out, families);
        return out.str();
    }

} // namespace pushgw
