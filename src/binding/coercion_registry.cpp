#include "confwire/binding/coercion_registry.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include "confwire/binding/builtin_coercions.hpp"

namespace confwire::binding {

CoercionRegistry CoercionRegistry::with_defaults() {
    CoercionRegistry registry;
    coercions::register_builtin_coercions(registry);
    return registry;
}

const CoercionRegistry& CoercionRegistry::defaults() {
    static const CoercionRegistry registry = with_defaults();
    return registry;
}

std::any CoercionRegistry::coerce_any(std::type_index type,
                                      const std::string& name,
                                      const std::string& raw) const {
    auto it = coercers_.find(type);
    if (it == coercers_.end()) {
        throw CoercionError(CoercionErrorKind::NO_COERCION, name, raw);
    }

    try {
        return it->second(raw);
    } catch (const CoercionError&) {
        throw;
    } catch (const std::exception& e) {
        throw CoercionError(CoercionErrorKind::UNPARSEABLE, name, raw,
                            e.what());
    }
}

long long CoercionRegistry::match_enum(std::type_index type,
                                       const std::string& name,
                                       const std::string& raw,
                                       bool case_sensitive) const {
    auto it = enums_.find(type);
    if (it == enums_.end()) {
        throw CoercionError(CoercionErrorKind::NO_COERCION, name, raw);
    }

    const std::string text = boost::algorithm::trim_copy(raw);
    for (const auto& [member, value] : it->second) {
        const bool matches = case_sensitive
                                 ? member == text
                                 : boost::algorithm::iequals(member, text);
        if (matches) {
            return value;
        }
    }

    long long numeric = 0;
    if (boost::conversion::try_lexical_convert(text, numeric)) {
        for (const auto& [member, value] : it->second) {
            if (value == numeric) {
                return value;
            }
        }
    }

    throw CoercionError(CoercionErrorKind::UNPARSEABLE, name, raw,
                        "not a member of the enumeration");
}

}  // namespace confwire::binding
