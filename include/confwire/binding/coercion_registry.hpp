#pragma once

#include <any>
#include <functional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "confwire/binding/coercion_error.hpp"
#include "confwire/binding/target_type.hpp"

namespace confwire::binding {

/**
 * @brief Detects a `static T parse(const std::string&)` member
 */
template <typename T, typename = void>
struct has_static_parse : std::false_type {};

template <typename T>
struct has_static_parse<
    T, std::void_t<decltype(T::parse(std::declval<const std::string&>()))>>
    : std::is_convertible<decltype(T::parse(std::declval<const std::string&>())),
                          T> {};

template <typename T>
constexpr bool has_static_parse_v = has_static_parse<T>::value;

/**
 * @brief Closed set of string-to-type conversions keyed by type identity
 *
 * Populate it at startup, then share it read-only between resolutions.
 * Enumerations are matched against explicit member-name tables.
 */
class CoercionRegistry {
public:
    using Coercer = std::function<std::any(const std::string&)>;

    CoercionRegistry() = default;

    /**
     * @brief Registry holding every built-in conversion
     *
     * bool, char, the standard integer and floating point types,
     * std::string, std::chrono durations (time-span grammar),
     * boost::uuids::uuid and boost::urls::url.
     */
    static CoercionRegistry with_defaults();

    // Shared immutable instance of with_defaults()
    static const CoercionRegistry& defaults();

    template <typename T>
    void add(std::function<T(const std::string&)> coercer) {
        coercers_[std::type_index(typeid(T))] =
            [coercer = std::move(coercer)](const std::string& raw) -> std::any {
            return std::any(coercer(raw));
        };
    }

    /**
     * @brief Register T through its own `static T parse(const std::string&)`
     */
    template <typename T>
    void add_parsable() {
        static_assert(has_static_parse_v<T>,
                      "T must provide static T parse(const std::string&)");
        add<T>([](const std::string& raw) -> T { return T::parse(raw); });
    }

    template <typename E>
    void add_enum(const std::vector<std::pair<std::string, E>>& members) {
        static_assert(std::is_enum_v<E>, "E must be an enumeration");
        auto& table = enums_[std::type_index(typeid(E))];
        table.clear();
        for (const auto& [name, value] : members) {
            table.emplace_back(name, static_cast<long long>(value));
        }
    }

    template <typename T>
    bool contains() const {
        const std::type_index type(typeid(T));
        if constexpr (std::is_enum_v<T>) {
            return enums_.count(type) > 0;
        } else {
            return coercers_.count(type) > 0;
        }
    }

    /**
     * @brief Convert one raw value
     * @throws CoercionError (UNPARSEABLE or NO_COERCION)
     */
    template <typename T>
    T coerce(const std::string& raw) const {
        return std::any_cast<T>(
            coerce_any(std::type_index(typeid(T)), type_name<T>(), raw));
    }

    /**
     * @brief Match a member name, or a registered member's numeric value
     * @throws CoercionError (UNPARSEABLE or NO_COERCION)
     */
    template <typename E>
    E coerce_enum(const std::string& raw, bool case_sensitive) const {
        static_assert(std::is_enum_v<E>, "E must be an enumeration");
        using Underlying = std::underlying_type_t<E>;
        const long long value = match_enum(std::type_index(typeid(E)),
                                           type_name<E>(), raw, case_sensitive);
        return static_cast<E>(static_cast<Underlying>(value));
    }

    size_t size() const { return coercers_.size() + enums_.size(); }

private:
    std::any coerce_any(std::type_index type, const std::string& name,
                        const std::string& raw) const;
    long long match_enum(std::type_index type, const std::string& name,
                         const std::string& raw, bool case_sensitive) const;

    std::unordered_map<std::type_index, Coercer> coercers_;
    std::unordered_map<std::type_index,
                       std::vector<std::pair<std::string, long long>>>
        enums_;
};

}  // namespace confwire::binding
