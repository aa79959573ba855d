#include "confwire/binding/target_type.hpp"

namespace confwire::binding {

std::string_view to_string(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::SCALAR:
            return "scalar";
        case ShapeKind::NULLABLE_SCALAR:
            return "nullable";
        case ShapeKind::ENUM:
            return "enum";
        case ShapeKind::ARRAY:
            return "array";
        case ShapeKind::LIST:
            return "list";
        case ShapeKind::READ_ONLY_LIST:
            return "read_only_list";
    }
    return "unknown";
}

TargetType::TargetType(ShapeKind kind, std::type_index type, std::string name,
                       std::shared_ptr<const TargetType> element)
    : kind_(kind),
      type_(type),
      name_(std::move(name)),
      element_(std::move(element)) {}

bool TargetType::is_collection() const {
    return kind_ == ShapeKind::ARRAY || kind_ == ShapeKind::LIST ||
           kind_ == ShapeKind::READ_ONLY_LIST;
}

std::string TargetType::describe() const {
    if (kind_ == ShapeKind::SCALAR) {
        return name_;
    }
    std::string text(to_string(kind_));
    text += '<';
    text += element_ ? element_->describe() : name_;
    text += '>';
    return text;
}

}  // namespace confwire::binding
