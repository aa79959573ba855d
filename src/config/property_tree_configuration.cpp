#include "confwire/config/property_tree_configuration.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <sstream>

#include "confwire/log/logger.hpp"

namespace confwire::config {

namespace pt = boost::property_tree;

namespace {

pt::ptree::path_type to_path(const std::string& key) {
    return pt::ptree::path_type(key, ConfigurationPath::key_delimiter);
}

// Leaves carry their data even when empty; sections only when they have
// data of their own.
std::optional<std::string> node_value(const pt::ptree& node) {
    if (node.empty() || !node.data().empty()) {
        return node.data();
    }
    return std::nullopt;
}

// JSON arrays come back from read_json as children with empty names.
pt::ptree index_sequences(const pt::ptree& node) {
    pt::ptree result;
    result.data() = node.data();

    bool is_sequence = !node.empty();
    for (const auto& child : node) {
        if (!child.first.empty()) {
            is_sequence = false;
            break;
        }
    }

    std::size_t index = 0;
    for (const auto& child : node) {
        std::string name =
            is_sequence ? std::to_string(index++) : child.first;
        result.push_back(
            std::make_pair(std::move(name), index_sequences(child.second)));
    }
    return result;
}

}  // namespace

PropertyTreeConfiguration::PropertyTreeConfiguration(pt::ptree tree)
    : tree_(std::move(tree)) {}

pt::ptree PropertyTreeConfiguration::yaml_to_ptree(const YAML::Node& node) {
    pt::ptree tree;
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            tree.push_back(std::make_pair(it->first.as<std::string>(),
                                          yaml_to_ptree(it->second)));
        }
    } else if (node.IsSequence()) {
        std::size_t index = 0;
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            tree.push_back(
                std::make_pair(std::to_string(index++), yaml_to_ptree(*it)));
        }
    } else if (node.IsScalar()) {
        tree.data() = node.Scalar();
    }
    return tree;
}

PropertyTreeConfiguration PropertyTreeConfiguration::load(
    const std::string& config_file, ConfigFormat format) {
    CONFWIRE_LOG_INFO << "Loading config file: " << config_file;

    pt::ptree tree;
    try {
        switch (format) {
            case ConfigFormat::YAML: {
                tree = yaml_to_ptree(YAML::LoadFile(config_file));
                break;
            }
            case ConfigFormat::JSON: {
                pt::ptree raw;
                pt::read_json(config_file, raw);
                tree = index_sequences(raw);
                break;
            }
            case ConfigFormat::INI: {
                pt::read_ini(config_file, tree);
                break;
            }
        }
    } catch (const std::exception& e) {
        CONFWIRE_LOG_ERROR << "Failed to load config file: " << config_file
                           << ", Error: " << e.what();
        throw ConfigurationError("Failed to load config file: " +
                                 config_file + ", Error: " + e.what());
    }

    CONFWIRE_LOG_DEBUG << "Loaded config file: " << config_file;
    return PropertyTreeConfiguration(std::move(tree));
}

PropertyTreeConfiguration PropertyTreeConfiguration::from_yaml_string(
    const std::string& content) {
    try {
        return PropertyTreeConfiguration(yaml_to_ptree(YAML::Load(content)));
    } catch (const YAML::Exception& e) {
        CONFWIRE_LOG_ERROR << "Failed to parse YAML configuration: "
                           << e.what();
        throw ConfigurationError(
            std::string("Failed to parse YAML configuration: ") + e.what());
    }
}

PropertyTreeConfiguration PropertyTreeConfiguration::from_json_string(
    const std::string& content) {
    std::istringstream iss(content);
    pt::ptree raw;
    try {
        pt::read_json(iss, raw);
    } catch (const pt::json_parser_error& e) {
        CONFWIRE_LOG_ERROR << "Failed to parse JSON configuration: "
                           << e.what();
        throw ConfigurationError(
            std::string("Failed to parse JSON configuration: ") + e.what());
    }
    return PropertyTreeConfiguration(index_sequences(raw));
}

PropertyTreeConfiguration PropertyTreeConfiguration::from_pairs(
    const std::vector<std::pair<std::string, std::string>>& entries) {
    pt::ptree tree;
    for (const auto& [key, value] : entries) {
        if (key.empty()) {
            throw ConfigurationError("Configuration key cannot be empty");
        }
        tree.put(to_path(key), value);
    }
    return PropertyTreeConfiguration(std::move(tree));
}

const pt::ptree* PropertyTreeConfiguration::find_node(
    const std::string& key) const {
    auto node = tree_.get_child_optional(to_path(key));
    return node ? &*node : nullptr;
}

std::optional<std::string> PropertyTreeConfiguration::get(
    const std::string& key) const {
    const pt::ptree* node = find_node(key);
    if (node == nullptr) {
        return std::nullopt;
    }
    return node_value(*node);
}

std::vector<ConfigEntry> PropertyTreeConfiguration::get_children(
    const std::string& key) const {
    std::vector<ConfigEntry> children;
    const pt::ptree* node = find_node(key);
    if (node == nullptr) {
        return children;
    }

    children.reserve(node->size());
    for (const auto& [name, child] : *node) {
        children.push_back(ConfigEntry{name, node_value(child)});
    }
    return children;
}

void PropertyTreeConfiguration::bind_properties(
    ConfigurationProperties& properties) const {
    const std::string name = properties.properties_name();
    const pt::ptree* section = find_node(name);
    if (section == nullptr) {
        CONFWIRE_LOG_DEBUG << "No configuration found for properties: "
                           << name << ", using defaults";
        properties.validate();
        return;
    }

    try {
        properties.from_ptree(*section);
        properties.validate();
    } catch (const std::exception& e) {
        CONFWIRE_LOG_ERROR << "Failed to load configuration for properties "
                           << name << ": " << e.what();
        throw;
    }
    CONFWIRE_LOG_DEBUG << "Loaded configuration for properties: " << name;
}

}  // namespace confwire::config
