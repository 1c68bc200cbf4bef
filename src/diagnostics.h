#ifndef FORGE_DIAGNOSTICS_H
#define FORGE_DIAGNOSTICS_H

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "errors.h"

namespace forge {

/**
 * Renders an error as the fixed multi-line report:
 *
 *   [ERROR] Runtime error at 1:28...
 *      ...while calling 'g'...
 *           1| var f = || { print "hi"; }; f(1);
 *            |                            ^^^^
 *      ...declared at 1:9...
 *           1| var f = || { print "hi"; }; f(1);
 *            |         ^^^^^^^^^^^^^^^^^^
 *      ArityError: 'f' expected 0 arguments, found 1
 *
 * Color only wraps pieces of the text in ANSI escapes; the characters are
 * otherwise identical.
 */
std::string formatError(const Error& error, bool color = false);

// Source line plus caret underline, indented as in a report.
std::string formatSnippet(const Span& span, bool color = false);

void report(std::ostream& out, const Error& error, bool color = false);
void report(std::ostream& out, const std::vector<std::shared_ptr<Error>>& errors, bool color = false);

} // namespace forge

#endif // FORGE_DIAGNOSTICS_H
