#pragma once

#include <string>

#include "confwire/config/config.hpp"

namespace confwire::binding {

/**
 * @brief What the resolver does when a value cannot be coerced
 */
enum class CoercionPolicy {
    USE_DEFAULT,  // Log a warning and return the type's default value
    STRICT        // Propagate the CoercionError
};

/**
 * @brief Resolver behaviour, read from the "binding" section
 *
 * binding:
 *   policy: use_default | strict
 *   enum_case_sensitive: true
 */
class ResolverOptions : public config::ConfigurationProperties {
public:
    CoercionPolicy policy = CoercionPolicy::USE_DEFAULT;
    bool enum_case_sensitive = true;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    std::string properties_name() const override { return "binding"; }

    static CoercionPolicy policy_from_string(const std::string& policy_str);
    static std::string policy_to_string(CoercionPolicy policy);
};

}  // namespace confwire::binding
