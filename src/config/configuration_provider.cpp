#include "confwire/config/configuration_provider.hpp"

namespace confwire::config {

std::string ConfigurationPath::combine(std::string_view parent,
                                       std::string_view child) {
    if (parent.empty()) {
        return std::string(child);
    }
    std::string key(parent);
    key += key_delimiter;
    key += child;
    return key;
}

std::string ConfigurationPath::last_segment(std::string_view key) {
    auto pos = key.rfind(key_delimiter);
    if (pos == std::string_view::npos) {
        return std::string(key);
    }
    return std::string(key.substr(pos + 1));
}

}  // namespace confwire::config
