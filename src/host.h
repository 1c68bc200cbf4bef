#ifndef FORGE_HOST_H
#define FORGE_HOST_H

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "errors.h"
#include "value.h"

namespace forge {

// Iteration state for `for x in <custom>`. next() returns false when done.
class HostIterator {
public:
    virtual ~HostIterator() = default;
    virtual bool next(Value& out) = 0;
};

/**
 * Operation table for a host defined value type. Only name() is required;
 * every other capability has a default that either falls back to identity
 * or reports that the capability is missing.
 */
class HostType {
public:
    virtual ~HostType() = default;

    virtual std::string name() const = 0;

    virtual bool equals(const CustomValue& a, const CustomValue& b) const {
        return a.payload == b.payload;
    }

    virtual std::string display(const CustomValue&) const { return "<" + name() + ">"; }

    // nullptr means the type is not iterable.
    virtual std::unique_ptr<HostIterator> iterate(const CustomValue&) const { return nullptr; }

    virtual bool callable() const { return false; }
    // Number of arguments call() takes, or FunctionData::kVariadic.
    virtual int arity() const { return FunctionData::kVariadic; }
    virtual Value call(Interpreter&, const CustomValue&, std::vector<Value>&) const {
        throw TypeError("value of type '" + name() + "' is not callable", Span{});
    }

    // Conversion used when a Custom value meets an operator; nullopt when
    // there is no sensible value of `target` kind.
    virtual std::optional<Value> coerce(const CustomValue&, ValueKind) const { return std::nullopt; }
};

inline Value makeCustom(std::shared_ptr<const HostType> type, std::shared_ptr<void> payload) {
    return Value::custom(CustomValue{std::move(type), std::move(payload)});
}

} // namespace forge

#endif // FORGE_HOST_H
