#include "env/Environment.h"
#include "common/Logger.h"

namespace SMI {

namespace {

class EmptyEnvironment : public Environment {
public:
    std::optional<Value> lookup(const std::string & /* name */) const override {
        return std::nullopt;
    }

    std::vector<std::string> getNames() const override {
        return {};
    }
};

}  // namespace

namespace Detail {

void throwKindMismatch(ValueKind expected, const Value &actual) {
    const char *expectedName = valueKindName(expected);
    const char *actualName = valueKindName(valueKindOf(actual));
    LOG_ERROR("Value kind mismatch: expected {}, found {} ({})", expectedName, actualName, toString(actual));
    throw KindMismatchError(expectedName, actualName);
}

}  // namespace Detail

const char *valueKindName(ValueKind kind) {
    switch (kind) {
    case ValueKind::Bool:
        return "bool";
    case ValueKind::Int32:
        return "i32";
    case ValueKind::UInt32:
        return "u32";
    case ValueKind::Int64:
        return "i64";
    case ValueKind::UInt64:
        return "u64";
    case ValueKind::Float:
        return "f32";
    case ValueKind::Double:
        return "f64";
    case ValueKind::String:
        return "String";
    }
    return "unknown";
}

std::string toString(const Value &value) {
    return std::visit(
        [](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return fmt::format("\"{}\"", v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

std::shared_ptr<const Environment> Environment::empty() {
    static const std::shared_ptr<const Environment> instance = std::make_shared<EmptyEnvironment>();
    return instance;
}

std::string toString(const Environment &environment) {
    std::string result = "{";
    bool first = true;
    for (const auto &name : environment.getNames()) {
        auto value = environment.lookup(name);
        if (!value.has_value()) {
            continue;
        }
        if (!first) {
            result += ", ";
        }
        result += name + ": " + toString(*value);
        first = false;
    }
    result += "}";
    return result;
}

}  // namespace SMI
