#ifndef FORGE_AST_PRINTER_H
#define FORGE_AST_PRINTER_H

#include <ostream>
#include <vector>
#include "ast.h"
#include "token.h"

namespace forge {

// Indented tree dump of a parsed program, one node per line with its position.
void printAst(std::ostream& out, const NodePtr& node, int indent = 0);

// One token per line: position, kind and lexeme.
void printTokens(std::ostream& out, const std::vector<Token>& tokens);

} // namespace forge

#endif // FORGE_AST_PRINTER_H
