#include "heap.h"
#include <algorithm>
#include <unordered_set>
#include "env.h"

namespace forge {

Heap::Heap(std::size_t threshold)
    : baseThreshold_(threshold), threshold_(threshold), pruneAt_(threshold) {}

void Heap::setThreshold(std::size_t threshold) {
    baseThreshold_ = threshold;
    threshold_ = threshold;
    pruneAt_ = threshold;
}

ListRef Heap::makeList(std::vector<Value> items) {
    pruneIfLarge();
    auto list = std::make_shared<ListData>();
    list->items = std::move(items);
    lists_.push_back(list);
    return list;
}

MapRef Heap::makeMap() {
    pruneIfLarge();
    auto map = std::make_shared<MapData>();
    maps_.push_back(map);
    return map;
}

std::shared_ptr<Scope> Heap::makeScope(std::shared_ptr<Scope> parent) {
    pruneIfLarge();
    auto scope = std::make_shared<Scope>(std::move(parent));
    scopes_.push_back(scope);
    return scope;
}

void Heap::pin(const Value& v) {
    pinned_.push_back(v);
}

void Heap::unpin(const Value& v) {
    auto it = std::find_if(pinned_.begin(), pinned_.end(),
                           [&](const Value& p) { return sameIdentity(p, v); });
    if (it != pinned_.end()) pinned_.erase(it);
}

template <typename T>
static void dropExpired(std::vector<std::weak_ptr<T>>& entries) {
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [](const std::weak_ptr<T>& w) { return w.expired(); }),
                  entries.end());
}

void Heap::prune() {
    dropExpired(lists_);
    dropExpired(maps_);
    dropExpired(scopes_);
}

// Objects without cycles die on their own; their registry slots are only
// reclaimed here so the registry stays proportional to what is alive.
void Heap::pruneIfLarge() {
    if (tracked() < pruneAt_) return;
    prune();
    pruneAt_ = std::max(baseThreshold_, tracked() * 2);
}

std::size_t Heap::collect(const std::vector<std::shared_ptr<Scope>>& roots) {
    std::unordered_set<const void*> marked;
    std::vector<const Value*> values;
    std::vector<const Scope*> scopes;

    for (const auto& root : roots) {
        if (root) scopes.push_back(root.get());
    }
    for (const auto& v : pinned_) values.push_back(&v);

    // Mark
    while (!values.empty() || !scopes.empty()) {
        if (!scopes.empty()) {
            const Scope* scope = scopes.back();
            scopes.pop_back();
            if (!marked.insert(scope).second) continue;
            for (const auto& entry : scope->variables()) values.push_back(&entry.second);
            if (scope->parent()) scopes.push_back(scope->parent().get());
            continue;
        }
        const Value* v = values.back();
        values.pop_back();
        switch (v->kind()) {
            case ValueKind::List: {
                const ListData* list = v->asList().get();
                if (!marked.insert(list).second) break;
                for (const auto& item : list->items) values.push_back(&item);
                break;
            }
            case ValueKind::Map: {
                const MapData* map = v->asMap().get();
                if (!marked.insert(map).second) break;
                for (const auto& entry : map->entries()) {
                    values.push_back(&entry.first);
                    values.push_back(&entry.second);
                }
                break;
            }
            case ValueKind::Function: {
                const auto& fn = v->asFunction();
                if (fn->closure) scopes.push_back(fn->closure.get());
                break;
            }
            default:
                break;
        }
    }

    // Sweep: empty whatever is alive but unreachable
    std::size_t cleared = 0;
    for (const auto& weak : lists_) {
        if (auto list = weak.lock()) {
            if (marked.count(list.get())) continue;
            std::vector<Value> doomed;
            doomed.swap(list->items);
            ++cleared;
        }
    }
    for (const auto& weak : maps_) {
        if (auto map = weak.lock()) {
            if (marked.count(map.get())) continue;
            std::vector<MapData::Entry> doomed = map->release();
            ++cleared;
        }
    }
    for (const auto& weak : scopes_) {
        if (auto scope = weak.lock()) {
            if (marked.count(scope.get())) continue;
            scope->clear();
            ++cleared;
        }
    }

    prune();
    threshold_ = std::max(baseThreshold_, tracked() * 2);
    pruneAt_ = threshold_;
    return cleared;
}

} // namespace forge
