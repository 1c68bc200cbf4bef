#include "value.h"
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include "heap.h"
#include "host.h"

namespace forge {

Value Value::string(const std::string& utf8Text) {
    return string(utf8::decode(utf8Text));
}

namespace {

// False for keys that compare structurally or through the host.
bool hashKey(const Value& key, std::size_t& out) {
    std::size_t h = 0;
    switch (key.kind()) {
        case ValueKind::Null: h = 0; break;
        case ValueKind::Number: {
            double d = key.asNumber();
            h = std::hash<double>()(d == 0.0 ? 0.0 : d);  // 0 and -0 are equal
            break;
        }
        case ValueKind::Str: h = std::hash<std::u32string>()(key.asStr()); break;
        case ValueKind::Char: h = std::hash<char32_t>()(key.asChar()); break;
        case ValueKind::Bool: h = key.asBool() ? 1 : 2; break;
        case ValueKind::Range:
            h = std::hash<std::int64_t>()(key.asRange().lo) * 31 + std::hash<std::int64_t>()(key.asRange().hi);
            break;
        case ValueKind::Function: h = std::hash<const void*>()(key.asFunction().get()); break;
        default: return false;
    }
    out = h * 16 + static_cast<std::size_t>(key.kind());
    return true;
}

} // namespace

Value* MapData::find(const Value& key) {
    std::size_t h = 0;
    if (hashKey(key, h)) {
        auto range = hashed_.equal_range(h);
        for (auto it = range.first; it != range.second; ++it) {
            Entry& entry = entries_[it->second];
            if (valuesEqual(entry.first, key)) return &entry.second;
        }
        return nullptr;
    }
    for (std::size_t i : unhashed_) {
        if (valuesEqual(entries_[i].first, key)) return &entries_[i].second;
    }
    return nullptr;
}

void MapData::set(const Value& key, Value value) {
    if (Value* slot = find(key)) {
        *slot = std::move(value);
        return;
    }
    append(key, std::move(value));
}

void MapData::append(const Value& key, Value value) {
    std::size_t h = 0;
    if (hashKey(key, h)) {
        hashed_.emplace(h, entries_.size());
    } else {
        unhashed_.push_back(entries_.size());
    }
    entries_.emplace_back(key, std::move(value));
}

std::vector<MapData::Entry> MapData::release() {
    std::vector<Entry> out;
    out.swap(entries_);
    hashed_.clear();
    unhashed_.clear();
    return out;
}

std::string typeName(const Value& v) {
    if (v.is(ValueKind::Custom)) {
        const auto& c = v.asCustom();
        return c.type ? c.type->name() : "custom";
    }
    return valueKindToString(v.kind());
}

bool isIntegral(double d) {
    return std::isfinite(d) && d == std::floor(d);
}

std::string formatNumber(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";
    std::ostringstream os;
    if (isIntegral(d) && std::fabs(d) < 1e15) {
        os << static_cast<long long>(d);
    } else {
        os << std::setprecision(15) << d;
    }
    return os.str();
}

namespace {

std::string quoted(const std::u32string& s, char quote) {
    std::string out(1, quote);
    for (char32_t c : s) {
        switch (c) {
            case U'\n': out += "\\n"; break;
            case U'\t': out += "\\t"; break;
            case U'\r': out += "\\r"; break;
            case U'\0': out += "\\0"; break;
            case U'\\': out += "\\\\"; break;
            default:
                if (c == static_cast<char32_t>(quote)) {
                    out += '\\';
                    out += quote;
                } else {
                    out += utf8::encode(c);
                }
        }
    }
    out += quote;
    return out;
}

void display(const Value& v, bool nested, std::unordered_set<const void*>& open, std::ostringstream& os) {
    switch (v.kind()) {
        case ValueKind::Null: os << "null"; break;
        case ValueKind::Number: os << formatNumber(v.asNumber()); break;
        case ValueKind::Str:
            if (nested) os << quoted(v.asStr(), '"');
            else os << utf8::encode(v.asStr());
            break;
        case ValueKind::Char:
            if (nested) os << quoted(std::u32string(1, v.asChar()), '\'');
            else os << utf8::encode(v.asChar());
            break;
        case ValueKind::Bool: os << (v.asBool() ? "true" : "false"); break;
        case ValueKind::Range: os << v.asRange().lo << ".." << v.asRange().hi; break;
        case ValueKind::Function: {
            const auto& fn = v.asFunction();
            if (fn->isNative()) {
                os << "<native " << fn->nativeName << ">";
            } else {
                os << "<function(";
                for (std::size_t i = 0; i < fn->params.size(); ++i) {
                    if (i > 0) os << ", ";
                    os << fn->params[i];
                }
                os << ")>";
            }
            break;
        }
        case ValueKind::List: {
            const ListData* list = v.asList().get();
            if (open.count(list)) { os << "[...]"; break; }
            open.insert(list);
            os << "[";
            for (std::size_t i = 0; i < list->items.size(); ++i) {
                if (i > 0) os << ", ";
                display(list->items[i], true, open, os);
            }
            os << "]";
            open.erase(list);
            break;
        }
        case ValueKind::Map: {
            const MapData* map = v.asMap().get();
            if (open.count(map)) { os << "[...]"; break; }
            if (map->empty()) { os << "[:]"; break; }
            open.insert(map);
            os << "[";
            for (std::size_t i = 0; i < map->size(); ++i) {
                if (i > 0) os << ", ";
                display(map->entries()[i].first, true, open, os);
                os << ": ";
                display(map->entries()[i].second, true, open, os);
            }
            os << "]";
            open.erase(map);
            break;
        }
        case ValueKind::Custom: {
            const auto& c = v.asCustom();
            os << (c.type ? c.type->display(c) : "<custom>");
            break;
        }
    }
}

using PairSet = std::set<std::pair<const void*, const void*>>;

bool equalImpl(const Value& a, const Value& b, PairSet& seen) {
    if (a.kind() != b.kind()) return false;
    switch (a.kind()) {
        case ValueKind::Null: return true;
        case ValueKind::Number: return a.asNumber() == b.asNumber();
        case ValueKind::Str: return a.asStr() == b.asStr();
        case ValueKind::Char: return a.asChar() == b.asChar();
        case ValueKind::Bool: return a.asBool() == b.asBool();
        case ValueKind::Range:
            return a.asRange().lo == b.asRange().lo && a.asRange().hi == b.asRange().hi;
        case ValueKind::Function: return a.asFunction() == b.asFunction();
        case ValueKind::List: {
            const ListData* x = a.asList().get();
            const ListData* y = b.asList().get();
            if (x == y) return true;
            // A pair already being compared further up is assumed equal
            if (!seen.insert({x, y}).second) return true;
            if (x->items.size() != y->items.size()) return false;
            for (std::size_t i = 0; i < x->items.size(); ++i) {
                if (!equalImpl(x->items[i], y->items[i], seen)) return false;
            }
            return true;
        }
        case ValueKind::Map: {
            MapData* x = a.asMap().get();
            MapData* y = b.asMap().get();
            if (x == y) return true;
            if (!seen.insert({x, y}).second) return true;
            if (x->size() != y->size()) return false;
            for (const auto& entry : x->entries()) {
                const Value* other = nullptr;
                for (const auto& candidate : y->entries()) {
                    if (equalImpl(entry.first, candidate.first, seen)) { other = &candidate.second; break; }
                }
                if (!other || !equalImpl(entry.second, *other, seen)) return false;
            }
            return true;
        }
        case ValueKind::Custom: {
            const auto& x = a.asCustom();
            const auto& y = b.asCustom();
            if (x.type != y.type || !x.type) return false;
            return x.type->equals(x, y);
        }
    }
    return false;
}

Value cloneImpl(const Value& v, Heap& heap, std::unordered_map<const void*, Value>& memo) {
    if (v.is(ValueKind::List)) {
        const ListData* src = v.asList().get();
        auto found = memo.find(src);
        if (found != memo.end()) return found->second;
        ListRef copy = heap.makeList();
        Value result = Value::list(copy);
        memo.emplace(src, result);
        copy->items.reserve(src->items.size());
        for (const auto& item : src->items) copy->items.push_back(cloneImpl(item, heap, memo));
        return result;
    }
    if (v.is(ValueKind::Map)) {
        const MapData* src = v.asMap().get();
        auto found = memo.find(src);
        if (found != memo.end()) return found->second;
        MapRef copy = heap.makeMap();
        Value result = Value::map(copy);
        memo.emplace(src, result);
        for (const auto& entry : src->entries()) {
            Value key = cloneImpl(entry.first, heap, memo);
            copy->append(key, cloneImpl(entry.second, heap, memo));
        }
        return result;
    }
    return v;
}

} // namespace

std::string displayValue(const Value& v) {
    std::unordered_set<const void*> open;
    std::ostringstream os;
    display(v, false, open, os);
    return os.str();
}

std::string reprValue(const Value& v) {
    std::unordered_set<const void*> open;
    std::ostringstream os;
    display(v, true, open, os);
    return os.str();
}

bool valuesEqual(const Value& a, const Value& b) {
    PairSet seen;
    return equalImpl(a, b, seen);
}

bool sameIdentity(const Value& a, const Value& b) {
    if (a.kind() != b.kind()) return false;
    switch (a.kind()) {
        case ValueKind::List: return a.asList() == b.asList();
        case ValueKind::Map: return a.asMap() == b.asMap();
        case ValueKind::Function: return a.asFunction() == b.asFunction();
        case ValueKind::Custom: return a.asCustom().payload == b.asCustom().payload;
        default: return valuesEqual(a, b);
    }
}

Value cloneValue(const Value& v, Heap& heap) {
    std::unordered_map<const void*, Value> memo;
    return cloneImpl(v, heap, memo);
}

} // namespace forge
