#include "confwire/binding/resolver_options.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <stdexcept>

namespace confwire::binding {

void ResolverOptions::from_ptree(const boost::property_tree::ptree& pt) {
    if (auto policy_str = get_optional_value<std::string>(pt, "policy")) {
        policy = policy_from_string(*policy_str);
    }
    enum_case_sensitive =
        get_value(pt, "enum_case_sensitive", enum_case_sensitive);
}

CoercionPolicy ResolverOptions::policy_from_string(
    const std::string& policy_str) {
    const std::string lower = boost::algorithm::to_lower_copy(policy_str);
    if (lower == "use_default" || lower == "lenient") {
        return CoercionPolicy::USE_DEFAULT;
    }
    if (lower == "strict") {
        return CoercionPolicy::STRICT;
    }
    throw std::invalid_argument("Invalid coercion policy: " + policy_str);
}

std::string ResolverOptions::policy_to_string(CoercionPolicy policy) {
    switch (policy) {
        case CoercionPolicy::USE_DEFAULT:
            return "use_default";
        case CoercionPolicy::STRICT:
            return "strict";
    }
    return "unknown";
}

}  // namespace confwire::binding
