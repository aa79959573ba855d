// tests/binding/test_inject_configuration.cpp
#define BOOST_TEST_MODULE inject_configuration_tests
#include <boost/test/unit_test.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "confwire/binding/inject_configuration.hpp"
#include "confwire/config/property_tree_configuration.hpp"
#include "confwire/di/container.hpp"

using namespace confwire::binding;
using confwire::config::ConfigurationProvider;
using confwire::config::PropertyTreeConfiguration;
using confwire::di::Container;
using confwire::di::NullServiceError;
using confwire::di::ServiceNotRegisteredError;

namespace test_types {

enum class Transport { Tcp, Udp };

}  // namespace test_types

using test_types::Transport;

struct ConfiguredContainer {
    Container container;

    ConfiguredContainer() {
        container.add_instance<ConfigurationProvider>(
            std::make_shared<PropertyTreeConfiguration>(
                PropertyTreeConfiguration::from_pairs({
                    {"Retry:MaxAttempts", "5"},
                    {"Retry:Timeout", "00:00:30"},
                    {"Retry:Delay", "later"},
                    {"Net:Transport", "udp"},
                    {"Feature:Tags:0", "a"},
                    {"Feature:Tags:1", "b"},
                })));
    }
};

BOOST_FIXTURE_TEST_SUITE(inject_configuration_suite, ConfiguredContainer)

BOOST_AUTO_TEST_CASE(test_configuration_key) {
    InjectConfiguration annotation("Retry:MaxAttempts");
    BOOST_CHECK_EQUAL(annotation.configuration_key(), "Retry:MaxAttempts");
}

BOOST_AUTO_TEST_CASE(test_resolve_from_container) {
    BOOST_CHECK_EQUAL(
        InjectConfiguration("Retry:MaxAttempts").resolve<int>(container), 5);
    BOOST_CHECK(InjectConfiguration("Retry:Timeout")
                    .resolve<std::chrono::seconds>(container) ==
                std::chrono::seconds(30));
    BOOST_CHECK(InjectConfiguration("Feature:Tags")
                    .resolve<std::vector<std::string>>(container) ==
                std::vector<std::string>({"a", "b"}));
    BOOST_CHECK(!InjectConfiguration("Retry:Backoff")
                     .resolve<std::optional<int>>(container)
                     .has_value());
}

BOOST_AUTO_TEST_CASE(test_resolve_without_provider) {
    Container empty;
    BOOST_CHECK_THROW(InjectConfiguration("Retry:MaxAttempts").resolve<int>(empty),
                      ServiceNotRegisteredError);
}

BOOST_AUTO_TEST_CASE(test_resolve_with_null_provider) {
    Container null_provider;
    null_provider.add_instance<ConfigurationProvider>(nullptr);

    BOOST_CHECK_THROW(
        InjectConfiguration("Retry:MaxAttempts").resolve<int>(null_provider),
        NullServiceError);
}

BOOST_AUTO_TEST_CASE(test_registered_options_are_used) {
    InjectConfiguration annotation("Retry:Delay");
    BOOST_CHECK(annotation.resolve<std::chrono::seconds>(container) ==
                std::chrono::seconds::zero());

    auto options = std::make_shared<ResolverOptions>();
    options->policy = CoercionPolicy::STRICT;
    container.add_instance<ResolverOptions>(options);

    BOOST_CHECK_THROW(annotation.resolve<std::chrono::seconds>(container),
                      CoercionError);
}

BOOST_AUTO_TEST_CASE(test_registered_registry_is_used) {
    auto registry =
        std::make_shared<CoercionRegistry>(CoercionRegistry::with_defaults());
    registry->add_enum<Transport>(
        {{"Tcp", Transport::Tcp}, {"Udp", Transport::Udp}});
    container.add_instance<CoercionRegistry>(registry);

    auto options = std::make_shared<ResolverOptions>();
    options->enum_case_sensitive = false;
    container.add_instance<ResolverOptions>(options);

    BOOST_CHECK(InjectConfiguration("Net:Transport").resolve<Transport>(
                    container) == Transport::Udp);
    BOOST_CHECK_EQUAL(
        InjectConfiguration("Retry:MaxAttempts").resolve<int>(container), 5);
}

BOOST_AUTO_TEST_CASE(test_describe) {
    BOOST_CHECK_EQUAL(InjectConfiguration::describe<int>().describe(), "int");
    BOOST_CHECK(InjectConfiguration::describe<std::vector<int>>().kind() ==
                ShapeKind::LIST);
    BOOST_CHECK(InjectConfiguration::describe<std::optional<double>>().kind() ==
                ShapeKind::NULLABLE_SCALAR);
}

BOOST_AUTO_TEST_SUITE_END()
