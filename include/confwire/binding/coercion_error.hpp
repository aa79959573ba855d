#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace confwire::binding {

enum class CoercionErrorKind {
    MISSING_VALUE,  // No raw value for a type without an empty state
    UNPARSEABLE,    // The coercion function rejected the raw value
    NO_COERCION     // Nothing registered for the target type
};

/**
 * @brief A raw configuration string could not become the requested type
 */
class CoercionError : public std::runtime_error {
public:
    CoercionError(CoercionErrorKind kind, std::string target_type,
                  std::optional<std::string> raw_value,
                  const std::string& detail = {});

    CoercionErrorKind kind() const { return kind_; }
    const std::string& target_type() const { return target_type_; }
    const std::optional<std::string>& raw_value() const { return raw_value_; }

private:
    CoercionErrorKind kind_;
    std::string target_type_;
    std::optional<std::string> raw_value_;
};

std::string to_string(CoercionErrorKind kind);

}  // namespace confwire::binding
