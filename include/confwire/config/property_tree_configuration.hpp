#pragma once

#include <yaml-cpp/yaml.h>

#include <boost/property_tree/ptree.hpp>
#include <string>
#include <utility>
#include <vector>

#include "confwire/config/config.hpp"
#include "confwire/config/configuration_provider.hpp"

namespace confwire::config {

/**
 * @brief ConfigurationProvider backed by a boost::property_tree::ptree
 *
 * The tree is immutable once constructed. Sequence nodes coming from YAML
 * or JSON are stored with index keys so that children keep their declared
 * order and "Section:Items:0" addresses the first element.
 */
class PropertyTreeConfiguration : public ConfigurationProvider {
public:
    PropertyTreeConfiguration() = default;
    explicit PropertyTreeConfiguration(boost::property_tree::ptree tree);

    static PropertyTreeConfiguration load(const std::string& config_file,
                                          ConfigFormat format);
    static PropertyTreeConfiguration from_yaml_string(
        const std::string& content);
    static PropertyTreeConfiguration from_json_string(
        const std::string& content);
    static PropertyTreeConfiguration from_pairs(
        const std::vector<std::pair<std::string, std::string>>& entries);

    std::optional<std::string> get(const std::string& key) const override;
    std::vector<ConfigEntry> get_children(
        const std::string& key) const override;

    // Populate a settings block from the section named after it. A missing
    // section leaves the defaults in place.
    void bind_properties(ConfigurationProperties& properties) const;

    static boost::property_tree::ptree yaml_to_ptree(const YAML::Node& node);

private:
    const boost::property_tree::ptree* find_node(const std::string& key) const;

    boost::property_tree::ptree tree_;
};

}  // namespace confwire::config
