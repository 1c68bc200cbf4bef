#ifndef FORGE_VALUE_H
#define FORGE_VALUE_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
#include "source.h"
#include "types.h"

namespace forge {

class Scope;
class Interpreter;
class HostType;
class FunctionLiteral;

struct RangeValue {
    std::int64_t lo = 0;
    std::int64_t hi = 0;  // exclusive
};

// A host payload plus the operation table that knows how to handle it.
struct CustomValue {
    std::shared_ptr<const HostType> type;
    std::shared_ptr<void> payload;
};

struct ListData;
class MapData;
struct FunctionData;

using ListRef = std::shared_ptr<ListData>;
using MapRef = std::shared_ptr<MapData>;
using FunctionRef = std::shared_ptr<const FunctionData>;

class Value {
public:
    // Alternative order matches ValueKind.
    using Storage = std::variant<std::monostate, double, std::u32string, char32_t, bool,
                                 RangeValue, FunctionRef, ListRef, MapRef, CustomValue>;

    Value() = default;

    static Value null() { return Value(); }
    static Value number(double d) { return Value(Storage(std::in_place_index<1>, d)); }
    static Value string(std::u32string s) { return Value(Storage(std::in_place_index<2>, std::move(s))); }
    static Value string(const std::string& utf8Text);
    static Value character(char32_t c) { return Value(Storage(std::in_place_index<3>, c)); }
    static Value boolean(bool b) { return Value(Storage(std::in_place_index<4>, b)); }
    static Value range(std::int64_t lo, std::int64_t hi) {
        return Value(Storage(std::in_place_index<5>, RangeValue{lo, hi}));
    }
    static Value function(FunctionRef fn) { return Value(Storage(std::in_place_index<6>, std::move(fn))); }
    static Value list(ListRef l) { return Value(Storage(std::in_place_index<7>, std::move(l))); }
    static Value map(MapRef m) { return Value(Storage(std::in_place_index<8>, std::move(m))); }
    static Value custom(CustomValue c) { return Value(Storage(std::in_place_index<9>, std::move(c))); }

    ValueKind kind() const { return static_cast<ValueKind>(data_.index()); }
    bool is(ValueKind k) const { return kind() == k; }
    bool isNull() const { return kind() == ValueKind::Null; }

    double asNumber() const { return std::get<1>(data_); }
    const std::u32string& asStr() const { return std::get<2>(data_); }
    std::u32string& asStr() { return std::get<2>(data_); }
    char32_t asChar() const { return std::get<3>(data_); }
    bool asBool() const { return std::get<4>(data_); }
    const RangeValue& asRange() const { return std::get<5>(data_); }
    const FunctionRef& asFunction() const { return std::get<6>(data_); }
    const ListRef& asList() const { return std::get<7>(data_); }
    const MapRef& asMap() const { return std::get<8>(data_); }
    const CustomValue& asCustom() const { return std::get<9>(data_); }

    const Storage& storage() const { return data_; }

private:
    explicit Value(Storage s) : data_(std::move(s)) {}
    Storage data_;
};

struct ListData {
    std::vector<Value> items;
};

// Insertion ordered; keys compare with valuesEqual. Scalar and function keys
// are found through a hash index, list, map and custom keys by a linear scan.
class MapData {
public:
    using Entry = std::pair<Value, Value>;

    const std::vector<Entry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    Value* find(const Value& key);
    void set(const Value& key, Value value);
    // Adds an entry without looking for an equal key; the caller knows it is new.
    void append(const Value& key, Value value);
    // Hands the entries to the caller and leaves the map empty.
    std::vector<Entry> release();

private:
    std::vector<Entry> entries_;
    std::unordered_multimap<std::size_t, std::size_t> hashed_;  // key hash -> entry index
    std::vector<std::size_t> unhashed_;
};

using NativeCallback = std::function<Value(Interpreter&, std::vector<Value>&)>;

struct FunctionData {
    static constexpr int kVariadic = -1;

    // User function: parameters, body and the scope it closed over.
    std::vector<std::string> params;
    std::shared_ptr<const FunctionLiteral> literal;
    std::shared_ptr<Scope> closure;
    Span declaration;

    // Host native.
    std::string nativeName;
    int arity = 0;
    NativeCallback native;

    bool isNative() const { return static_cast<bool>(native); }
};

class Heap;

// Type name as shown to users; Custom values report their host type name.
std::string typeName(const Value& v);

// Print form. Strings and chars are raw at top level and quoted inside containers.
std::string displayValue(const Value& v);
// Quoted form, as the value would appear inside a list.
std::string reprValue(const Value& v);
std::string formatNumber(double d);
bool isIntegral(double d);

// Structural equality: deep for List/Map, identity for Function, host op for Custom.
bool valuesEqual(const Value& a, const Value& b);

// True when both refer to the same storage (or are equal scalars).
bool sameIdentity(const Value& a, const Value& b);

// Deep copy of List/Map graphs, preserving shared substructure and cycles.
Value cloneValue(const Value& v, Heap& heap);

} // namespace forge

#endif // FORGE_VALUE_H
