#include "env/BasicEnvironment.h"

namespace SMI {

std::optional<Value> BasicEnvironment::lookup(const std::string &name) const {
    for (const auto &[boundName, value] : bindings_) {
        if (boundName == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::vector<std::string> BasicEnvironment::getNames() const {
    std::vector<std::string> names;
    names.reserve(bindings_.size());
    for (const auto &binding : bindings_) {
        names.push_back(binding.first);
    }
    return names;
}

void BasicEnvironment::set(const std::string &name, Value value) {
    for (auto &binding : bindings_) {
        if (binding.first == name) {
            binding.second = std::move(value);
            return;
        }
    }
    bindings_.emplace_back(name, std::move(value));
}

}  // namespace SMI
