#include "confwire/binding/coercion_error.hpp"

namespace confwire::binding {

namespace {

std::string format_message(CoercionErrorKind kind,
                           const std::string& target_type,
                           const std::optional<std::string>& raw_value,
                           const std::string& detail) {
    std::string message;
    switch (kind) {
        case CoercionErrorKind::MISSING_VALUE:
            message = "No value to convert to type " + target_type;
            break;
        case CoercionErrorKind::UNPARSEABLE:
            message = "Cannot convert value '" + raw_value.value_or("") +
                      "' to type " + target_type;
            break;
        case CoercionErrorKind::NO_COERCION:
            message = "No coercion registered for type " + target_type;
            break;
    }
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

}  // namespace

CoercionError::CoercionError(CoercionErrorKind kind, std::string target_type,
                             std::optional<std::string> raw_value,
                             const std::string& detail)
    : std::runtime_error(
          format_message(kind, target_type, raw_value, detail)),
      kind_(kind),
      target_type_(std::move(target_type)),
      raw_value_(std::move(raw_value)) {}

std::string to_string(CoercionErrorKind kind) {
    switch (kind) {
        case CoercionErrorKind::MISSING_VALUE:
            return "missing_value";
        case CoercionErrorKind::UNPARSEABLE:
            return "unparseable";
        case CoercionErrorKind::NO_COERCION:
            return "no_coercion";
    }
    return "unknown";
}

}  // namespace confwire::binding
