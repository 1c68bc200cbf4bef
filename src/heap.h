#ifndef FORGE_HEAP_H
#define FORGE_HEAP_H

#include <cstddef>
#include <memory>
#include <vector>
#include "value.h"

namespace forge {

class Scope;

// Allocation point and cycle collector for shared storage.
//
// Ownership is plain shared_ptr; the heap only keeps weak references to every
// List, Map and Scope it hands out. collect() marks everything reachable from
// the roots and the pinned values, then empties each object that is still
// alive but unmarked. Emptying breaks the reference cycles that kept it alive
// and reference counting releases the rest.
class Heap {
public:
    static constexpr std::size_t kDefaultThreshold = 4096;

    explicit Heap(std::size_t threshold = kDefaultThreshold);

    ListRef makeList(std::vector<Value> items = {});
    MapRef makeMap();
    std::shared_ptr<Scope> makeScope(std::shared_ptr<Scope> parent);

    // Objects currently registered (live or not yet pruned).
    std::size_t tracked() const { return lists_.size() + maps_.size() + scopes_.size(); }
    bool shouldCollect() const { return tracked() > threshold_; }
    std::size_t threshold() const { return threshold_; }
    void setThreshold(std::size_t threshold);

    std::size_t collect(const std::vector<std::shared_ptr<Scope>>& roots);

    // Host held values survive collection until unpinned.
    void pin(const Value& v);
    void unpin(const Value& v);
    std::size_t pinnedCount() const { return pinned_.size(); }

private:
    void prune();
    void pruneIfLarge();

    std::vector<std::weak_ptr<ListData>> lists_;
    std::vector<std::weak_ptr<MapData>> maps_;
    std::vector<std::weak_ptr<Scope>> scopes_;
    std::vector<Value> pinned_;
    std::size_t baseThreshold_;
    std::size_t threshold_;
    std::size_t pruneAt_;
};

} // namespace forge

#endif // FORGE_HEAP_H
