#pragma once

#include <map>
#include <set>
#include <string>

namespace pushgw
{

/// Validates label names used in a grouping key.
/// Names must match [a-zA-Z_][a-zA-Z0-9_]*, must not start with the reserved
/// "__" prefix and must not be one of the reserved names.
class label_validator
{
public:
    label_validator();
    explicit label_validator(std::set<std::string> reserved_labels);

    /// @throws invalid_label_set_error on the first offending name
    void validate_symbols(const std::map<std::string, std::string>& labels) const;

    /// @throws invalid_label_set_error if @p name is malformed or reserved
    void validate_name(const std::string& name) const;

    [[nodiscard]] const std::set<std::string>& reserved_labels() const { return reserved_; }

private:
    std::set<std::string> reserved_;
};

} // namespace pushgw
