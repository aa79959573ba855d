#pragma once

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "confwire/binding/inject_configuration.hpp"
#include "confwire/di/container.hpp"

namespace confwire::di {

/**
 * @brief Constructor argument taken from another registered service
 */
template <typename T>
class ServiceParameter {
public:
    using value_type = std::shared_ptr<T>;

    std::shared_ptr<T> resolve(Container& container) const {
        return container.get_required_service<T>();
    }
};

/**
 * @brief Constructor argument bound to a configuration key
 */
template <typename T>
class ConfiguredParameter {
public:
    using value_type = T;

    explicit ConfiguredParameter(std::string configuration_key)
        : annotation_(std::move(configuration_key)) {}

    T resolve(Container& container) const {
        return annotation_.resolve<T>(container);
    }

    const binding::InjectConfiguration& annotation() const {
        return annotation_;
    }

private:
    binding::InjectConfiguration annotation_;
};

template <typename T>
ServiceParameter<T> from_service() {
    return ServiceParameter<T>();
}

template <typename T>
ConfiguredParameter<T> from_config(std::string configuration_key) {
    return ConfiguredParameter<T>(std::move(configuration_key));
}

/**
 * @brief Binds configuration keys to data members of T
 */
template <typename T>
class PropertyBinder {
public:
    template <typename Member>
    PropertyBinder& bind(Member T::*member, std::string configuration_key) {
        binding::InjectConfiguration annotation(std::move(configuration_key));
        bindings_.push_back(
            [member, annotation](T& target, Container& container) {
                target.*member = annotation.resolve<Member>(container);
            });
        return *this;
    }

    void apply(T& target, Container& container) const {
        for (const auto& binding : bindings_) {
            binding(target, container);
        }
    }

    size_t size() const { return bindings_.size(); }

private:
    std::vector<std::function<void(T&, Container&)>> bindings_;
};

/**
 * @brief Container with constructor and property injection from
 * configuration
 */
class ServiceContainer : public Container {
public:
    /**
     * @brief Register TImplementation built from resolved constructor
     * arguments
     *
     * Each parameter is a ServiceParameter or a ConfiguredParameter and is
     * resolved every time the factory runs.
     */
    template <typename TInterface, typename TImplementation = TInterface,
              typename... Parameters>
    void add_configured(ServiceLifetime lifetime, Parameters... parameters) {
        static_assert(
            std::is_base_of_v<TInterface, TImplementation> ||
                std::is_same_v<TInterface, TImplementation>,
            "Implementation must inherit from or be the same as Interface");

        Container::add_factory<TInterface>(
            std::function<std::shared_ptr<TInterface>(Container&)>(
                [parameters...](Container& container)
                    -> std::shared_ptr<TInterface> {
                    return std::make_shared<TImplementation>(
                        parameters.resolve(container)...);
                }),
            lifetime);
    }

    /**
     * @brief Register a default-constructed TImplementation whose members
     * are then assigned from configuration
     */
    template <typename TInterface, typename TImplementation = TInterface>
    void add_bound(PropertyBinder<TImplementation> properties,
                   ServiceLifetime lifetime = ServiceLifetime::SINGLETON) {
        static_assert(
            std::is_base_of_v<TInterface, TImplementation> ||
                std::is_same_v<TInterface, TImplementation>,
            "Implementation must inherit from or be the same as Interface");

        Container::add_factory<TInterface>(
            std::function<std::shared_ptr<TInterface>(Container&)>(
                [properties = std::move(properties)](Container& container)
                    -> std::shared_ptr<TInterface> {
                    auto instance = std::make_shared<TImplementation>();
                    properties.apply(*instance, container);
                    return instance;
                }),
            lifetime);
    }
};

}  // namespace confwire::di

#define CONFWIRE_REGISTER_CONFIGURED(container, interface, impl, ...) \
    (container).add_configured<interface, impl>(__VA_ARGS__)
