#pragma once

#include "common/Errors.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace SMI {

/**
 * @brief Dynamically-typed value exposed through an Environment
 *
 * Closed over the value kinds a machine description can declare.
 * ValueKind lists the same alternatives in the same order.
 */
using Value = std::variant<bool, int32_t, uint32_t, int64_t, uint64_t, float, double, std::string>;

enum class ValueKind { Bool, Int32, UInt32, Int64, UInt64, Float, Double, String };

namespace Detail {

template <typename T, typename Variant> struct VariantIndex;

template <typename T, typename... Alternatives> struct VariantIndex<T, std::variant<Alternatives...>> {
    static constexpr std::size_t value = [] {
        constexpr bool matches[] = {std::is_same_v<T, Alternatives>...};
        for (std::size_t i = 0; i < sizeof...(Alternatives); ++i) {
            if (matches[i]) {
                return i;
            }
        }
        return sizeof...(Alternatives);
    }();
};

[[noreturn]] void throwKindMismatch(ValueKind expected, const Value &actual);

}  // namespace Detail

template <typename T> constexpr ValueKind valueKindOf() {
    constexpr std::size_t index = Detail::VariantIndex<T, Value>::value;
    static_assert(index < std::variant_size_v<Value>, "T is not a Value alternative");
    return static_cast<ValueKind>(index);
}

inline ValueKind valueKindOf(const Value &value) {
    return static_cast<ValueKind>(value.index());
}

const char *valueKindName(ValueKind kind);

/**
 * @brief Extract a typed value, faulting on a kind mismatch
 *
 * @throws KindMismatchError if @p value does not hold a T
 */
template <typename T> const T &valueAs(const Value &value) {
    if (const T *typed = std::get_if<T>(&value)) {
        return *typed;
    }
    Detail::throwKindMismatch(valueKindOf<T>(), value);
}

// Strings are quoted, floating point uses the shortest round-trip form
std::string toString(const Value &value);

/**
 * @brief Closed, named, read-only value lookup
 *
 * Generated code provides one concrete Environment per event signature and
 * per state (arguments, variables) plus one for the machine's domain
 * variables. Observers use it without knowing the generated types.
 */
class Environment {
public:
    virtual ~Environment() = default;

    /**
     * @brief Look up a bound value by name
     * @return The value, or std::nullopt if the name is not bound here
     */
    virtual std::optional<Value> lookup(const std::string &name) const = 0;

    /**
     * @brief Bound names in declaration order
     */
    virtual std::vector<std::string> getNames() const = 0;

    /**
     * @brief Look up and extract as T
     * @return std::nullopt if the name is not bound
     * @throws KindMismatchError if the name is bound to a different kind
     */
    template <typename T> std::optional<T> get(const std::string &name) const {
        auto value = lookup(name);
        if (!value.has_value()) {
            return std::nullopt;
        }
        return valueAs<T>(*value);
    }

    bool contains(const std::string &name) const {
        return lookup(name).has_value();
    }

    /**
     * @brief Shared environment with no bindings
     */
    static std::shared_ptr<const Environment> empty();
};

// Renders "{a: 3, b: \"x\"}" in declaration order
std::string toString(const Environment &environment);

}  // namespace SMI
