#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace confwire::config {

/**
 * @brief One immediate child of a configuration section
 *
 * Sequence elements are named by their index ("0", "1", ...), mapping
 * entries by their key.
 */
struct ConfigEntry {
    std::string name;
    std::optional<std::string> value;
};

// Helpers for ':'-separated configuration keys
class ConfigurationPath {
public:
    static constexpr char key_delimiter = ':';

    static std::string combine(std::string_view parent, std::string_view child);
    static std::string last_segment(std::string_view key);
};

/**
 * @brief Read access to a hierarchical settings tree
 *
 * Implementations must be safe for concurrent reads.
 */
class ConfigurationProvider {
public:
    virtual ~ConfigurationProvider() = default;

    /**
     * @brief Raw value stored at an exact key
     * @return std::nullopt when the key is missing or names a section
     */
    virtual std::optional<std::string> get(const std::string& key) const = 0;

    /**
     * @brief Immediate children of a key, in stored order
     * @return empty when the key is missing or is a leaf
     */
    virtual std::vector<ConfigEntry> get_children(
        const std::string& key) const = 0;

    bool exists(const std::string& key) const {
        return get(key).has_value() || !get_children(key).empty();
    }
};

}  // namespace confwire::config
