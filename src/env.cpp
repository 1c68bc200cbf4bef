#include "env.h"

namespace forge {

Environment::Environment(std::size_t gcThreshold)
    : heap_(gcThreshold), global_(heap_.makeScope(nullptr)) {}

void Environment::defineNative(const std::string& name, int arity, NativeCallback callback) {
    auto fn = std::make_shared<FunctionData>();
    fn->nativeName = name;
    fn->arity = arity;
    fn->native = std::move(callback);
    global_->declare(name, Value::function(std::move(fn)));
}

} // namespace forge
