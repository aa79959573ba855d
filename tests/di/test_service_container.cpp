// tests/di/test_service_container.cpp
#define BOOST_TEST_MODULE service_container_tests
#include <boost/test/unit_test.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "confwire/config/property_tree_configuration.hpp"
#include "confwire/di/di.hpp"

using namespace confwire::di;
using confwire::config::ConfigurationProvider;
using confwire::config::PropertyTreeConfiguration;

namespace {

struct IClock {
    virtual ~IClock() = default;
    virtual int now() const = 0;
};

class FixedClock : public IClock {
public:
    int now() const override { return 42; }
};

struct IRetryPolicy {
    virtual ~IRetryPolicy() = default;
    virtual int max_attempts() const = 0;
};

class RetryPolicy : public IRetryPolicy {
public:
    RetryPolicy(std::shared_ptr<IClock> clock, int max_attempts,
                std::chrono::seconds timeout, std::vector<std::string> tags)
        : clock_(std::move(clock)),
          max_attempts_(max_attempts),
          timeout_(timeout),
          tags_(std::move(tags)) {}

    int max_attempts() const override { return max_attempts_; }
    std::chrono::seconds timeout() const { return timeout_; }
    const std::vector<std::string>& tags() const { return tags_; }
    const std::shared_ptr<IClock>& clock() const { return clock_; }

private:
    std::shared_ptr<IClock> clock_;
    int max_attempts_;
    std::chrono::seconds timeout_;
    std::vector<std::string> tags_;
};

struct ServerSettings {
    std::string host;
    int port = 0;
    std::optional<int> backlog;
    std::vector<int> mirrors;
};

std::shared_ptr<ConfigurationProvider> make_configuration() {
    return std::make_shared<PropertyTreeConfiguration>(
        PropertyTreeConfiguration::from_yaml_string(R"(
Retry:
  MaxAttempts: 5
  Timeout: "00:00:30"
Feature:
  Tags: [a, b, c]
Server:
  Host: example.org
  Port: 8443
  Mirrors: [1, 2]
)"));
}

}  // namespace

BOOST_AUTO_TEST_SUITE(service_container_suite)

BOOST_AUTO_TEST_CASE(test_add_configured_mixes_services_and_configuration) {
    auto container = create_container();
    container->add_instance<ConfigurationProvider>(make_configuration());
    container->add_singleton<IClock, FixedClock>();

    container->add_configured<IRetryPolicy, RetryPolicy>(
        ServiceLifetime::TRANSIENT, from_service<IClock>(),
        from_config<int>("Retry:MaxAttempts"),
        from_config<std::chrono::seconds>("Retry:Timeout"),
        from_config<std::vector<std::string>>("Feature:Tags"));

    auto policy = std::dynamic_pointer_cast<RetryPolicy>(
        container->get_required_service<IRetryPolicy>());
    BOOST_REQUIRE(policy);
    BOOST_CHECK_EQUAL(policy->max_attempts(), 5);
    BOOST_CHECK(policy->timeout() == std::chrono::seconds(30));
    BOOST_CHECK(policy->tags() == std::vector<std::string>({"a", "b", "c"}));
    BOOST_CHECK_EQUAL(policy->clock()->now(), 42);
}

BOOST_AUTO_TEST_CASE(test_add_configured_singleton_resolves_once) {
    auto container = create_container();
    container->add_instance<ConfigurationProvider>(make_configuration());
    container->add_singleton<IClock, FixedClock>();

    CONFWIRE_REGISTER_CONFIGURED(
        *container, IRetryPolicy, RetryPolicy, ServiceLifetime::SINGLETON,
        from_service<IClock>(), from_config<int>("Retry:MaxAttempts"),
        from_config<std::chrono::seconds>("Retry:Timeout"),
        from_config<std::vector<std::string>>("Feature:Tags"));

    auto first = container->get_required_service<IRetryPolicy>();
    auto second = container->get_required_service<IRetryPolicy>();
    BOOST_CHECK_EQUAL(first.get(), second.get());
}

BOOST_AUTO_TEST_CASE(test_add_configured_without_provider_fails) {
    ServiceContainer container;
    container.add_singleton<IClock, FixedClock>();
    container.add_configured<IRetryPolicy, RetryPolicy>(
        ServiceLifetime::TRANSIENT, from_service<IClock>(),
        from_config<int>("Retry:MaxAttempts"),
        from_config<std::chrono::seconds>("Retry:Timeout"),
        from_config<std::vector<std::string>>("Feature:Tags"));

    BOOST_CHECK_THROW(container.get_required_service<IRetryPolicy>(),
                      ServiceNotRegisteredError);
}

BOOST_AUTO_TEST_CASE(test_configured_parameter_keeps_key) {
    auto parameter = from_config<int>("Retry:MaxAttempts");
    BOOST_CHECK_EQUAL(parameter.annotation().configuration_key(),
                      "Retry:MaxAttempts");
}

BOOST_AUTO_TEST_CASE(test_property_binder_assigns_members) {
    ServiceContainer container;
    container.add_instance<ConfigurationProvider>(make_configuration());

    PropertyBinder<ServerSettings> properties;
    properties.bind(&ServerSettings::host, "Server:Host")
        .bind(&ServerSettings::port, "Server:Port")
        .bind(&ServerSettings::backlog, "Server:Backlog")
        .bind(&ServerSettings::mirrors, "Server:Mirrors");
    BOOST_CHECK_EQUAL(properties.size(), 4u);

    container.add_bound<ServerSettings>(properties);

    auto settings = container.get_required_service<ServerSettings>();
    BOOST_CHECK_EQUAL(settings->host, "example.org");
    BOOST_CHECK_EQUAL(settings->port, 8443);
    BOOST_CHECK(!settings->backlog.has_value());
    BOOST_CHECK(settings->mirrors == std::vector<int>({1, 2}));
}

BOOST_AUTO_TEST_CASE(test_property_binder_apply_on_existing_object) {
    ServiceContainer container;
    container.add_instance<ConfigurationProvider>(make_configuration());

    ServerSettings settings;
    settings.port = 1;

    PropertyBinder<ServerSettings> properties;
    properties.bind(&ServerSettings::port, "Server:Port");
    properties.apply(settings, container);

    BOOST_CHECK_EQUAL(settings.port, 8443);
}

BOOST_AUTO_TEST_SUITE_END()
