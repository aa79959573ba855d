// Wires a retry policy from a YAML file (or built-in defaults) through the
// service container.
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "confwire/config/property_tree_configuration.hpp"
#include "confwire/di/di.hpp"
#include "confwire/log/log_config.hpp"
#include "confwire/log/logger.hpp"

namespace {

const char* kDefaultConfig = R"(
log:
  global_level: info
  console:
    enabled: true
binding:
  policy: use_default
Retry:
  MaxAttempts: 5
  Timeout: "00:00:30"
  Backoff: "00:00:00.250"
  Codes: ["502", "503", "unavailable"]
)";

class RetryPolicy {
public:
    RetryPolicy(int max_attempts, std::chrono::seconds timeout,
                std::optional<std::chrono::milliseconds> backoff,
                std::vector<int> codes)
        : max_attempts_(max_attempts),
          timeout_(timeout),
          backoff_(backoff),
          codes_(std::move(codes)) {}

    void print(std::ostream& os) const {
        os << "max_attempts=" << max_attempts_
           << " timeout=" << timeout_.count() << "s";
        if (backoff_) {
            os << " backoff=" << backoff_->count() << "ms";
        }
        os << " codes=[";
        for (size_t i = 0; i < codes_.size(); ++i) {
            os << (i ? "," : "") << codes_[i];
        }
        os << "]" << std::endl;
    }

private:
    int max_attempts_;
    std::chrono::seconds timeout_;
    std::optional<std::chrono::milliseconds> backoff_;
    std::vector<int> codes_;
};

}  // namespace

int main(int argc, char* argv[]) {
    using namespace confwire;

    try {
        auto configuration = std::make_shared<config::PropertyTreeConfiguration>(
            argc > 1 ? config::PropertyTreeConfiguration::load(
                           argv[1], config::ConfigFormat::YAML)
                     : config::PropertyTreeConfiguration::from_yaml_string(
                           kDefaultConfig));

        log::LogConfig log_config;
        configuration->bind_properties(log_config);
        log::Logger::init(log_config);

        auto options = std::make_shared<binding::ResolverOptions>();
        configuration->bind_properties(*options);

        auto container = di::create_container();
        container->add_instance<config::ConfigurationProvider>(configuration);
        container->add_instance<binding::ResolverOptions>(options);
        container->add_configured<RetryPolicy>(
            di::ServiceLifetime::SINGLETON,
            di::from_config<int>("Retry:MaxAttempts"),
            di::from_config<std::chrono::seconds>("Retry:Timeout"),
            di::from_config<std::optional<std::chrono::milliseconds>>(
                "Retry:Backoff"),
            di::from_config<std::vector<int>>("Retry:Codes"));

        container->get_required_service<RetryPolicy>()->print(std::cout);

        log::Logger::shutdown();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
