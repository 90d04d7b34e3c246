#include <pushgw/label_validator.hpp>
#include <pushgw/errors.hpp>

#include <regex>
#include <utility>

namespace pushgw
{

    namespace
    {
        // "job" is already carried by the path itself.
        const std::set<std::string> default_reserved_labels {"job", "pid"};
    } // namespace

    label_validator::label_validator()
      : reserved_ {default_reserved_labels}
    {
    }

    label_validator::label_validator(std::set<std::string> reserved_labels)
      : reserved_ {std::move(reserved_labels)}
    {
    }

    void label_validator::validate_symbols(
      const std::map<std::string, std::string>& labels
    ) const
    {
        for (const auto& [key, value]: labels)
        {
            (void) value;
            validate_name(key);
        }
    }

    void label_validator::validate_name(const std::string& name) const
    {
        static const std::regex label_regex("^[a-zA-Z_][a-zA-Z0-9_]*$");

        if (name.empty())
        {
            throw invalid_label_set_error("Label name cannot be empty");
        }
        if (name.size() >= 2 && name[0] == '_' && name[1] == '_')
        {
            throw invalid_label_set_error(
              "Label name '" + name + "' cannot start with '__' (reserved prefix)"
            );
        }
        if (!std::regex_match(name, label_regex))
        {
            throw invalid_label_set_error(
              "Invalid label name '" + name +
              "'. Must match [a-zA-Z_][a-zA-Z0-9_]*"
            );
        }
        if (reserved_.count(name))
        {
            throw invalid_label_set_error(
              "Label name '" + name + "' is reserved"
            );
        }
    }

} // namespace pushgw
