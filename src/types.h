#ifndef FORGE_TYPES_H
#define FORGE_TYPES_H

#include <optional>
#include <ostream>
#include <string>

namespace forge {

/**
 * ValueKind: the closed set of runtime value categories.
 *
 * Null     = absence of a value
 * Number   = 64-bit float
 * Str      = mutable character sequence (value semantics)
 * Char     = one unicode scalar
 * Bool     = true / false
 * Range    = integral half-open interval lo..hi
 * Function = user closure or host native
 * List     = shared, growable sequence
 * Map      = shared, insertion-ordered dictionary
 * Custom   = host supplied payload with its own operation table
 */
enum class ValueKind {
    Null,
    Number,
    Str,
    Char,
    Bool,
    Range,
    Function,
    List,
    Map,
    Custom
};

// Name used in diagnostics and by the `type` native.
std::string valueKindToString(ValueKind k);

/**
 * Target of an `expr as <name>` conversion. Only the kinds that have a
 * conversion defined are accepted: number, string, char, bool and list.
 */
std::optional<ValueKind> parseCastTarget(const std::string& name);

// Comma separated list of the accepted cast target names.
std::string castTargetNames();

} // namespace forge

inline std::ostream& operator<<(std::ostream& os, forge::ValueKind k) {
    return os << forge::valueKindToString(k);
}

#endif // FORGE_TYPES_H
