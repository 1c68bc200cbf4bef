#ifndef FORGE_PRELUDE_H
#define FORGE_PRELUDE_H

#include "env.h"

namespace forge {

// Registers the natives every CLI session starts with:
//   len(x)  type(x)  push(list, v)  pop(list)  keys(map)  clock()
void registerPrelude(Environment& env);

} // namespace forge

#endif // FORGE_PRELUDE_H
