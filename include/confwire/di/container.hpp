#pragma once

#include <boost/core/demangle.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>

namespace confwire::di {

/**
 * @brief Service lifetime scope
 */
enum class ServiceLifetime {
    TRANSIENT,  // New instance every time
    SINGLETON   // Single instance for the container
};

/**
 * @brief Raised when a required service has no registration
 */
class ServiceNotRegisteredError : public std::runtime_error {
public:
    explicit ServiceNotRegisteredError(const std::string& service_name)
        : std::runtime_error("Service not registered: " + service_name),
          service_name_(service_name) {}

    const std::string& service_name() const { return service_name_; }

private:
    std::string service_name_;
};

/**
 * @brief Raised when a required service is registered but resolves to null
 */
class NullServiceError : public std::runtime_error {
public:
    explicit NullServiceError(const std::string& service_name)
        : std::runtime_error("Service resolved to null: " + service_name),
          service_name_(service_name) {}

    const std::string& service_name() const { return service_name_; }

private:
    std::string service_name_;
};

class Container;

using ServiceFactory = std::function<std::shared_ptr<void>(Container&)>;

struct ServiceDescriptor {
    std::type_index service_type;
    ServiceFactory factory;
    ServiceLifetime lifetime;
    std::shared_ptr<void> singleton_instance;

    ServiceDescriptor(std::type_index type, ServiceFactory fact,
                      ServiceLifetime life)
        : service_type(type), factory(std::move(fact)), lifetime(life) {}
};

/**
 * @brief Service registry used by the injection helpers
 *
 * Factories receive the container so that they can resolve their own
 * dependencies, including configuration values.
 */
class Container {
private:
    std::unordered_map<std::type_index, std::unique_ptr<ServiceDescriptor>>
        services_;

public:
    Container() = default;
    virtual ~Container() = default;

    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;
    Container(Container&&) = default;
    Container& operator=(Container&&) = default;

    template <typename TInterface, typename TImplementation = TInterface>
    void add_transient() {
        static_assert(
            std::is_base_of_v<TInterface, TImplementation> ||
                std::is_same_v<TInterface, TImplementation>,
            "Implementation must inherit from or be the same as Interface");

        register_service<TInterface>(
            [](Container&) -> std::shared_ptr<void> {
                return std::static_pointer_cast<void>(
                    std::shared_ptr<TInterface>(
                        std::make_shared<TImplementation>()));
            },
            ServiceLifetime::TRANSIENT);
    }

    template <typename TInterface, typename TImplementation = TInterface>
    void add_singleton() {
        static_assert(
            std::is_base_of_v<TInterface, TImplementation> ||
                std::is_same_v<TInterface, TImplementation>,
            "Implementation must inherit from or be the same as Interface");

        register_service<TInterface>(
            [](Container&) -> std::shared_ptr<void> {
                return std::static_pointer_cast<void>(
                    std::shared_ptr<TInterface>(
                        std::make_shared<TImplementation>()));
            },
            ServiceLifetime::SINGLETON);
    }

    /**
     * @brief Register a service built by a factory that needs the container
     */
    template <typename TInterface>
    void add_factory(
        std::function<std::shared_ptr<TInterface>(Container&)> factory,
        ServiceLifetime lifetime = ServiceLifetime::TRANSIENT) {
        register_service<TInterface>(
            [factory = std::move(factory)](
                Container& container) -> std::shared_ptr<void> {
                return std::static_pointer_cast<void>(factory(container));
            },
            lifetime);
    }

    template <typename TInterface>
    void add_factory(std::function<std::shared_ptr<TInterface>()> factory,
                     ServiceLifetime lifetime = ServiceLifetime::TRANSIENT) {
        register_service<TInterface>(
            [factory = std::move(factory)](Container&) -> std::shared_ptr<void> {
                return std::static_pointer_cast<void>(factory());
            },
            lifetime);
    }

    /**
     * @brief Register an existing instance as singleton
     */
    template <typename TInterface>
    void add_instance(std::shared_ptr<TInterface> instance) {
        auto descriptor = std::make_unique<ServiceDescriptor>(
            std::type_index(typeid(TInterface)),
            [instance](Container&) -> std::shared_ptr<void> {
                return std::static_pointer_cast<void>(instance);
            },
            ServiceLifetime::SINGLETON);
        descriptor->singleton_instance =
            std::static_pointer_cast<void>(instance);

        services_[std::type_index(typeid(TInterface))] = std::move(descriptor);
    }

    /**
     * @brief Resolve a registered service
     * @throws ServiceNotRegisteredError if T has no registration
     * @throws NullServiceError if the registration yields nullptr
     */
    template <typename T>
    std::shared_ptr<T> get_required_service() {
        if (!is_registered<T>()) {
            throw ServiceNotRegisteredError(
                boost::core::demangle(typeid(T).name()));
        }
        auto instance = try_get_service<T>();
        if (!instance) {
            throw NullServiceError(boost::core::demangle(typeid(T).name()));
        }
        return instance;
    }

    template <typename T>
    std::shared_ptr<T> get_service() {
        return get_required_service<T>();
    }

    /**
     * @brief Resolve a service, or nullptr when T has no registration
     */
    template <typename T>
    std::shared_ptr<T> try_get_service() {
        auto it = services_.find(std::type_index(typeid(T)));
        if (it == services_.end()) {
            return nullptr;
        }

        auto& descriptor = *it->second;
        if (descriptor.lifetime == ServiceLifetime::SINGLETON) {
            if (!descriptor.singleton_instance) {
                descriptor.singleton_instance = descriptor.factory(*this);
            }
            return std::static_pointer_cast<T>(descriptor.singleton_instance);
        }

        return std::static_pointer_cast<T>(descriptor.factory(*this));
    }

    template <typename T>
    bool is_registered() const {
        return services_.find(std::type_index(typeid(T))) != services_.end();
    }

    size_t service_count() const { return services_.size(); }

    void clear() { services_.clear(); }

private:
    template <typename TInterface>
    void register_service(ServiceFactory factory, ServiceLifetime lifetime) {
        services_[std::type_index(typeid(TInterface))] =
            std::make_unique<ServiceDescriptor>(
                std::type_index(typeid(TInterface)), std::move(factory),
                lifetime);
    }
};

}  // namespace confwire::di
