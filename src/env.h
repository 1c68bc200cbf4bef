#ifndef FORGE_ENV_H
#define FORGE_ENV_H

#include <memory>
#include <string>
#include <unordered_map>
#include "heap.h"
#include "value.h"

namespace forge {

// One lexical scope. Lookups walk the parent chain; declarations always
// land in this scope and rebind an existing name.
class Scope : public std::enable_shared_from_this<Scope> {
public:
    explicit Scope(std::shared_ptr<Scope> parent) : parent_(std::move(parent)) {}

    void declare(const std::string& name, Value value) { vars_[name] = std::move(value); }

    Value* findLocal(const std::string& name) {
        auto it = vars_.find(name);
        return it == vars_.end() ? nullptr : &it->second;
    }

    Value* lookup(const std::string& name) {
        for (Scope* s = this; s; s = s->parent_.get()) {
            if (Value* v = s->findLocal(name)) return v;
        }
        return nullptr;
    }

    // Nearest scope that defines `name`, or nullptr.
    std::shared_ptr<Scope> owner(const std::string& name) {
        for (Scope* s = this; s; s = s->parent_.get()) {
            if (s->vars_.count(name)) return s->shared_from_this();
        }
        return nullptr;
    }

    const std::shared_ptr<Scope>& parent() const { return parent_; }
    const std::unordered_map<std::string, Value>& variables() const { return vars_; }

    // Drops every binding and the parent link; used by the collector.
    void clear() {
        vars_.clear();
        parent_.reset();
    }

private:
    std::shared_ptr<Scope> parent_;
    std::unordered_map<std::string, Value> vars_;
};

/**
 * The persistent top-level state a program runs against: the global scope
 * and the heap every List, Map and Scope of this environment comes from.
 * A REPL keeps one Environment alive across lines.
 */
class Environment {
public:
    explicit Environment(std::size_t gcThreshold = Heap::kDefaultThreshold);

    const std::shared_ptr<Scope>& global() const { return global_; }
    Heap& heap() { return heap_; }

    void define(const std::string& name, Value value) { global_->declare(name, std::move(value)); }
    // Registers a host callback; arity is FunctionData::kVariadic or a fixed count.
    void defineNative(const std::string& name, int arity, NativeCallback callback);

    Value* lookup(const std::string& name) { return global_->lookup(name); }

    // Runs the cycle collector with the global scope as root; returns the
    // number of unreachable objects cleared.
    std::size_t collectGarbage() { return heap_.collect({global_}); }

private:
    Heap heap_;
    std::shared_ptr<Scope> global_;
};

} // namespace forge

#endif // FORGE_ENV_H
