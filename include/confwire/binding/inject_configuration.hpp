#pragma once

#include <memory>
#include <string>

#include "confwire/binding/coercion_registry.hpp"
#include "confwire/binding/resolver_options.hpp"
#include "confwire/binding/target_type.hpp"
#include "confwire/binding/value_resolver.hpp"
#include "confwire/config/configuration_provider.hpp"
#include "confwire/di/container.hpp"

namespace confwire::binding {

/**
 * @brief Marks a constructor parameter or property as bound to a
 * configuration key
 *
 * The key is fixed when the annotation is created. Resolution fetches the
 * ConfigurationProvider from the container (a missing provider raises
 * di::ServiceNotRegisteredError). A CoercionRegistry or ResolverOptions
 * registered in the container replace the defaults.
 */
class InjectConfiguration {
public:
    explicit InjectConfiguration(std::string configuration_key)
        : configuration_key_(std::move(configuration_key)) {}

    const std::string& configuration_key() const { return configuration_key_; }

    template <typename T>
    T resolve(di::Container& services) const {
        auto configuration =
            services.get_required_service<config::ConfigurationProvider>();
        auto registry = services.try_get_service<CoercionRegistry>();
        auto options = services.try_get_service<ResolverOptions>();

        ValueResolver resolver(
            configuration_key_, *configuration,
            registry ? *registry : CoercionRegistry::defaults(),
            options ? *options : ResolverOptions());
        return resolver.resolve<T>();
    }

    template <typename T>
    static TargetType describe() {
        return target_type_of<T>();
    }

private:
    std::string configuration_key_;
};

}  // namespace confwire::binding
