#include "types.h"

namespace forge {

std::string valueKindToString(ValueKind k) {
    switch (k) {
        case ValueKind::Null:     return "null";
        case ValueKind::Number:   return "number";
        case ValueKind::Str:      return "string";
        case ValueKind::Char:     return "char";
        case ValueKind::Bool:     return "bool";
        case ValueKind::Range:    return "range";
        case ValueKind::Function: return "function";
        case ValueKind::List:     return "list";
        case ValueKind::Map:      return "map";
        case ValueKind::Custom:   return "custom";
    }
    return "unknown";
}

std::optional<ValueKind> parseCastTarget(const std::string& name) {
    if (name == "number") return ValueKind::Number;
    if (name == "string") return ValueKind::Str;
    if (name == "char") return ValueKind::Char;
    if (name == "bool") return ValueKind::Bool;
    if (name == "list") return ValueKind::List;
    return std::nullopt;
}

std::string castTargetNames() {
    return "number, string, char, bool, list";
}

} // namespace forge
