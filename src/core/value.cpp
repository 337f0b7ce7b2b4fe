/**
 * @file value.cpp
 * @brief Value helpers
 */

#include "procpool/core/value.hpp"

namespace procpool {

const char* value_type_name(const Value& value) noexcept {
    switch (value.index()) {
        case 0: return "none";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "double";
        case 4: return "string";
        case 5: return "blob";
        default: return "unknown";
    }
}

std::string to_string(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "(none)";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + v + "\"";
        } else {
            return "(blob: " + std::to_string(v.size()) + " bytes)";
        }
    }, value);
}

} // namespace procpool
