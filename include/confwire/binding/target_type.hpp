#pragma once

#include <boost/core/demangle.hpp>
#include <deque>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <vector>

#include "confwire/binding/collections.hpp"

namespace confwire::binding {

/**
 * @brief Shape of a binding target, selects the resolution strategy
 */
enum class ShapeKind {
    SCALAR,
    NULLABLE_SCALAR,
    ENUM,
    ARRAY,
    LIST,
    READ_ONLY_LIST
};

std::string_view to_string(ShapeKind kind);

/**
 * @brief Compile-time shape of a C++ type
 *
 * Every type has exactly one shape. Types that are not one of the
 * recognized wrappers or containers are scalars (or enums).
 */
template <typename T>
struct shape_traits {
    static constexpr ShapeKind kind =
        std::is_enum_v<T> ? ShapeKind::ENUM : ShapeKind::SCALAR;
};

template <typename T>
struct shape_traits<std::optional<T>> {
    static constexpr ShapeKind kind = ShapeKind::NULLABLE_SCALAR;
    using element_type = T;
};

template <typename T>
struct shape_traits<Array<T>> {
    static constexpr ShapeKind kind = ShapeKind::ARRAY;
    using element_type = T;
};

template <typename T>
struct shape_traits<ReadOnlyList<T>> {
    static constexpr ShapeKind kind = ShapeKind::READ_ONLY_LIST;
    using element_type = T;
};

template <typename T, typename Alloc>
struct shape_traits<std::vector<T, Alloc>> {
    static constexpr ShapeKind kind = ShapeKind::LIST;
    using element_type = T;
};

template <typename T, typename Alloc>
struct shape_traits<std::deque<T, Alloc>> {
    static constexpr ShapeKind kind = ShapeKind::LIST;
    using element_type = T;
};

template <typename T, typename Alloc>
struct shape_traits<std::list<T, Alloc>> {
    static constexpr ShapeKind kind = ShapeKind::LIST;
    using element_type = T;
};

template <typename T>
constexpr ShapeKind shape_of_v = shape_traits<T>::kind;

template <typename T>
constexpr bool is_collection_shape_v = shape_of_v<T> == ShapeKind::ARRAY ||
                                       shape_of_v<T> == ShapeKind::LIST ||
                                       shape_of_v<T> == ShapeKind::READ_ONLY_LIST;

/**
 * @brief Runtime description of a binding target
 */
class TargetType {
public:
    TargetType(ShapeKind kind, std::type_index type, std::string name,
               std::shared_ptr<const TargetType> element = nullptr);

    ShapeKind kind() const { return kind_; }
    std::type_index type() const { return type_; }
    const std::string& name() const { return name_; }

    // Element of a collection or nullable shape, nullptr for scalars
    const TargetType* element() const { return element_.get(); }

    bool is_collection() const;

    // e.g. "list<int>", "nullable<double>"
    std::string describe() const;

private:
    ShapeKind kind_;
    std::type_index type_;
    std::string name_;
    std::shared_ptr<const TargetType> element_;
};

template <typename T>
std::string type_name() {
    if constexpr (std::is_same_v<T, std::string>) {
        return "std::string";
    } else {
        return boost::core::demangle(typeid(T).name());
    }
}

template <typename T>
TargetType target_type_of() {
    constexpr ShapeKind kind = shape_of_v<T>;
    if constexpr (kind == ShapeKind::SCALAR || kind == ShapeKind::ENUM) {
        return TargetType(kind, std::type_index(typeid(T)), type_name<T>());
    } else {
        using Element = typename shape_traits<T>::element_type;
        return TargetType(
            kind, std::type_index(typeid(T)), type_name<T>(),
            std::make_shared<const TargetType>(target_type_of<Element>()));
    }
}

}  // namespace confwire::binding
