#pragma once

#include "common/Errors.h"
#include "common/Logger.h"
#include <memory>
#include <type_traits>
#include <typeinfo>

namespace SMI {

namespace Detail {

template <typename Instance> [[noreturn]] void throwShapeMismatch(const Instance &instance, const char *wanted) {
    LOG_ERROR("Instance of '{}' is not a {}", instance.getInfo().getName(), wanted);
    throw ShapeMismatchError("Instance of '" + instance.getInfo().getName() + "' is not a " + wanted);
}

}  // namespace Detail

/**
 * @brief Coerce a StateInstance or MethodInstance to its concrete generated type
 * @throws ShapeMismatchError if @p instance is not a T
 */
template <typename T, typename Instance>
    requires std::is_polymorphic_v<Instance>
T &instanceAs(Instance &instance) {
    if (auto *typed = dynamic_cast<T *>(&instance)) {
        return *typed;
    }
    Detail::throwShapeMismatch(instance, typeid(T).name());
}

template <typename T, typename Instance> std::shared_ptr<T> instanceAs(const std::shared_ptr<Instance> &instance) {
    if (!instance) {
        return nullptr;
    }
    if (auto typed = std::dynamic_pointer_cast<T>(instance)) {
        return typed;
    }
    Detail::throwShapeMismatch(*instance, typeid(T).name());
}

}  // namespace SMI
