#pragma once

#include <boost/property_tree/ptree.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace confwire::config {

enum class ConfigFormat { YAML, JSON, INI };

/**
 * @brief Raised when a configuration source cannot be read or parsed
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Strongly typed settings block bound from one section of the tree
class ConfigurationProperties {
public:
    virtual ~ConfigurationProperties() = default;
    virtual void from_ptree(const boost::property_tree::ptree& pt) = 0;
    virtual void validate() const {}
    virtual std::string properties_name() const = 0;  // Section name

protected:
    template <typename T>
    T get_value(const boost::property_tree::ptree& pt, const std::string& path,
                const T& default_value) {
        return pt.get<T>(path, default_value);
    }

    template <typename T>
    std::optional<T> get_optional_value(const boost::property_tree::ptree& pt,
                                        const std::string& path) {
        auto result = pt.get_optional<T>(path);
        if (result) {
            return *result;
        }
        return std::nullopt;
    }
};

}  // namespace confwire::config
