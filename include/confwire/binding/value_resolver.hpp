#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "confwire/binding/coercion_error.hpp"
#include "confwire/binding/coercion_registry.hpp"
#include "confwire/binding/collections.hpp"
#include "confwire/binding/resolver_options.hpp"
#include "confwire/binding/target_type.hpp"
#include "confwire/config/configuration_provider.hpp"

namespace confwire::binding {

/**
 * @brief Reads the value bound to one configuration key as a typed value
 *
 * The target shape is taken from shape_traits<T>:
 *   - ReadOnlyList<U>                      children, read-only sequence
 *   - std::vector/deque/list<U>            children appended in order
 *   - Array<U>                             children, fixed size
 *   - anything else                        the single value at the key
 *
 * Children are coerced in the order the provider returns them. A missing
 * key yields an empty collection.
 *
 * A resolver holds references only; it has no state of its own between
 * calls and may be used from several threads when the provider and the
 * registry are only read.
 */
class ValueResolver {
public:
    ValueResolver(std::string key,
                  const config::ConfigurationProvider& configuration,
                  const CoercionRegistry& registry = CoercionRegistry::defaults(),
                  ResolverOptions options = ResolverOptions());

    const std::string& key() const { return key_; }
    const ResolverOptions& options() const { return options_; }

    template <typename T>
    T resolve() const {
        constexpr ShapeKind kind = shape_of_v<T>;
        if constexpr (kind == ShapeKind::READ_ONLY_LIST) {
            return create_typed_read_only_list<
                typename shape_traits<T>::element_type>();
        } else if constexpr (kind == ShapeKind::LIST) {
            return create_typed_list<T>();
        } else if constexpr (kind == ShapeKind::ARRAY) {
            return create_typed_array<typename shape_traits<T>::element_type>();
        } else {
            return resolve_value<T>(configuration_.get(key_));
        }
    }

    /**
     * @brief Scalar coercion of one raw value, with the failure policy applied
     * @throws CoercionError only under CoercionPolicy::STRICT
     */
    template <typename T>
    T resolve_value(const std::optional<std::string>& raw) const {
        static_assert(!is_collection_shape_v<T>,
                      "Collections cannot be coerced from a single value");

        if constexpr (shape_of_v<T> == ShapeKind::NULLABLE_SCALAR) {
            using Underlying = typename shape_traits<T>::element_type;
            if (!raw) {
                return std::nullopt;
            }
            return T(resolve_value<Underlying>(raw));
        } else {
            try {
                return coerce_value<T>(raw);
            } catch (const CoercionError& e) {
                handle_failure(e);
                return T{};
            }
        }
    }

    /**
     * @brief Scalar coercion without policy or logging
     * @return std::nullopt when the value cannot be coerced
     */
    template <typename T>
    std::optional<T> try_resolve_value(
        const std::optional<std::string>& raw) const {
        try {
            if constexpr (shape_of_v<T> == ShapeKind::NULLABLE_SCALAR) {
                using Underlying = typename shape_traits<T>::element_type;
                if (!raw) {
                    return T(std::nullopt);
                }
                return T(coerce_value<Underlying>(raw));
            } else {
                return coerce_value<T>(raw);
            }
        } catch (const CoercionError&) {
            return std::nullopt;
        }
    }

    template <typename E>
    Array<E> create_typed_array() const {
        static_assert(!is_collection_shape_v<E>,
                      "Nested collections are not supported");
        const auto children = read_children();
        Array<E> result(children.size());
        for (std::size_t i = 0; i < children.size(); ++i) {
            result[i] = resolve_value<E>(children[i]);
        }
        return result;
    }

    template <typename TList>
    TList create_typed_list() const {
        using Element = typename TList::value_type;
        static_assert(!is_collection_shape_v<Element>,
                      "Nested collections are not supported");
        TList result;
        for (const auto& child : read_children()) {
            result.push_back(resolve_value<Element>(child));
        }
        return result;
    }

    template <typename E>
    ReadOnlyList<E> create_typed_read_only_list() const {
        return as_read_only(create_typed_array<E>());
    }

private:
    template <typename T>
    T coerce_value(const std::optional<std::string>& raw) const {
        if constexpr (std::is_same_v<T, std::string>) {
            return raw.value_or(std::string());
        } else {
            if (!raw) {
                throw CoercionError(CoercionErrorKind::MISSING_VALUE,
                                    type_name<T>(), std::nullopt);
            }
            if constexpr (shape_of_v<T> == ShapeKind::ENUM) {
                return registry_.coerce_enum<T>(*raw,
                                                options_.enum_case_sensitive);
            } else {
                return registry_.coerce<T>(*raw);
            }
        }
    }

    // Rethrows under STRICT, logs a warning otherwise
    void handle_failure(const CoercionError& error) const;

    std::vector<std::optional<std::string>> read_children() const;

    std::string key_;
    const config::ConfigurationProvider& configuration_;
    const CoercionRegistry& registry_;
    ResolverOptions options_;
};

}  // namespace confwire::binding
