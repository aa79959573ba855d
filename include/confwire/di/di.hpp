#pragma once

/**
 * @file di.hpp
 * @brief confwire dependency injection
 *
 * Service registry plus constructor and property injection of values bound
 * to configuration keys.
 */

#include "confwire/binding/inject_configuration.hpp"
#include "confwire/di/container.hpp"
#include "confwire/di/service_container.hpp"

namespace confwire::di {

inline std::unique_ptr<ServiceContainer> create_container() {
    return std::make_unique<ServiceContainer>();
}

}  // namespace confwire::di
