#include "confwire/binding/value_resolver.hpp"

#include "confwire/log/logger.hpp"

namespace confwire::binding {

ValueResolver::ValueResolver(std::string key,
                             const config::ConfigurationProvider& configuration,
                             const CoercionRegistry& registry,
                             ResolverOptions options)
    : key_(std::move(key)),
      configuration_(configuration),
      registry_(registry),
      options_(std::move(options)) {}

void ValueResolver::handle_failure(const CoercionError& error) const {
    if (options_.policy == CoercionPolicy::STRICT) {
        throw error;
    }
    CONFWIRE_LOG_WARN << "Configuration key '" << key_ << "': "
                      << error.what() << ", using default value of "
                      << error.target_type();
}

std::vector<std::optional<std::string>> ValueResolver::read_children() const {
    std::vector<std::optional<std::string>> values;
    const auto children = configuration_.get_children(key_);
    values.reserve(children.size());
    for (const auto& child : children) {
        values.push_back(child.value);
    }
    CONFWIRE_LOG_TRACE << "Configuration key '" << key_ << "' has "
                       << values.size() << " children";
    return values;
}

}  // namespace confwire::binding
