#include "ast_printer.h"
#include <string>
#include "utf8.h"
#include "value.h"

namespace forge {

namespace {

void line(std::ostream& out, int indent, const std::string& label, const ASTNode& node) {
    out << std::string(static_cast<std::size_t>(indent) * 2, ' ') << label;
    if (node.span.valid()) out << "  @" << node.span.line << ":" << node.span.column;
    out << "\n";
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

} // namespace

void printAst(std::ostream& out, const NodePtr& node, int indent) {
    if (!node) return;
    const int in = indent + 1;

    if (auto lit = std::dynamic_pointer_cast<Literal>(node)) {
        switch (lit->kind) {
            case LiteralKind::Number: line(out, indent, "Number " + formatNumber(lit->number), *lit); break;
            case LiteralKind::String: line(out, indent, "String \"" + utf8::encode(lit->text) + "\"", *lit); break;
            case LiteralKind::Char: line(out, indent, "Char '" + utf8::encode(lit->character) + "'", *lit); break;
            case LiteralKind::Bool: line(out, indent, std::string("Bool ") + (lit->boolean ? "true" : "false"), *lit); break;
            case LiteralKind::Null: line(out, indent, "Null", *lit); break;
        }
    } else if (auto id = std::dynamic_pointer_cast<Identifier>(node)) {
        line(out, indent, "Identifier " + id->name, *id);
    } else if (auto range = std::dynamic_pointer_cast<RangeExpression>(node)) {
        line(out, indent, "Range", *range);
        printAst(out, range->lo, in);
        printAst(out, range->hi, in);
    } else if (auto list = std::dynamic_pointer_cast<ListLiteral>(node)) {
        line(out, indent, "List", *list);
        for (const auto& e : list->elements) printAst(out, e, in);
    } else if (auto rep = std::dynamic_pointer_cast<ListRepeat>(node)) {
        line(out, indent, "ListRepeat", *rep);
        printAst(out, rep->item, in);
        printAst(out, rep->count, in);
    } else if (auto map = std::dynamic_pointer_cast<MapLiteral>(node)) {
        line(out, indent, "Map", *map);
        for (const auto& entry : map->entries) {
            printAst(out, entry.first, in);
            printAst(out, entry.second, in + 1);
        }
    } else if (auto fn = std::dynamic_pointer_cast<FunctionLiteral>(node)) {
        line(out, indent, "Function |" + joinNames(fn->params) + "|", *fn);
        printAst(out, fn->body, in);
    } else if (auto un = std::dynamic_pointer_cast<UnaryExpression>(node)) {
        line(out, indent, "Unary " + un->op.value, *un);
        printAst(out, un->operand, in);
    } else if (auto bin = std::dynamic_pointer_cast<BinaryExpression>(node)) {
        line(out, indent, "Binary " + bin->op.value, *bin);
        printAst(out, bin->left, in);
        printAst(out, bin->right, in);
    } else if (auto cast = std::dynamic_pointer_cast<CastExpression>(node)) {
        line(out, indent, "Cast " + valueKindToString(cast->target), *cast);
        printAst(out, cast->operand, in);
    } else if (auto call = std::dynamic_pointer_cast<CallExpression>(node)) {
        line(out, indent, "Call", *call);
        printAst(out, call->callee, in);
        for (const auto& a : call->args) printAst(out, a, in);
    } else if (auto idx = std::dynamic_pointer_cast<IndexExpression>(node)) {
        line(out, indent, "Index", *idx);
        printAst(out, idx->target, in);
        printAst(out, idx->index, in);
    } else if (auto assign = std::dynamic_pointer_cast<AssignExpression>(node)) {
        line(out, indent, "Assign " + assign->op.value, *assign);
        printAst(out, assign->target, in);
        printAst(out, assign->value, in);
    } else if (auto cl = std::dynamic_pointer_cast<CloneExpression>(node)) {
        line(out, indent, "Clone", *cl);
        printAst(out, cl->operand, in);
    } else if (auto mi = std::dynamic_pointer_cast<MirrorExpression>(node)) {
        line(out, indent, "Mirror", *mi);
        printAst(out, mi->operand, in);
    } else if (auto block = std::dynamic_pointer_cast<BlockStatement>(node)) {
        line(out, indent, "Block", *block);
        for (const auto& s : block->statements) printAst(out, s, in);
    } else if (auto decl = std::dynamic_pointer_cast<VarDeclaration>(node)) {
        line(out, indent, "Var " + decl->name, *decl);
        printAst(out, decl->initializer, in);
    } else if (auto es = std::dynamic_pointer_cast<ExpressionStatement>(node)) {
        line(out, indent, "ExpressionStatement", *es);
        printAst(out, es->expression, in);
    } else if (auto ifs = std::dynamic_pointer_cast<IfStatement>(node)) {
        line(out, indent, "If", *ifs);
        printAst(out, ifs->condition, in);
        printAst(out, ifs->thenBranch, in);
        if (ifs->elseBranch) {
            out << std::string(static_cast<std::size_t>(indent) * 2, ' ') << "Else\n";
            printAst(out, ifs->elseBranch, in);
        }
    } else if (auto wl = std::dynamic_pointer_cast<WhileLoop>(node)) {
        line(out, indent, "While", *wl);
        printAst(out, wl->condition, in);
        printAst(out, wl->body, in);
    } else if (auto fl = std::dynamic_pointer_cast<ForLoop>(node)) {
        line(out, indent, "For " + fl->variable, *fl);
        printAst(out, fl->iterable, in);
        printAst(out, fl->body, in);
    } else if (auto pr = std::dynamic_pointer_cast<PrintStatement>(node)) {
        line(out, indent, "Print", *pr);
        printAst(out, pr->expression, in);
    } else if (auto inp = std::dynamic_pointer_cast<InputStatement>(node)) {
        line(out, indent, "Input", *inp);
        printAst(out, inp->target, in);
        printAst(out, inp->prompt, in);
    } else if (auto ret = std::dynamic_pointer_cast<ReturnStatement>(node)) {
        line(out, indent, "Return", *ret);
        printAst(out, ret->expression, in);
    } else if (std::dynamic_pointer_cast<BreakStatement>(node)) {
        line(out, indent, "Break", *node);
    } else if (std::dynamic_pointer_cast<ContinueStatement>(node)) {
        line(out, indent, "Continue", *node);
    } else {
        line(out, indent, "<unknown>", *node);
    }
}

void printTokens(std::ostream& out, const std::vector<Token>& tokens) {
    for (const auto& t : tokens) {
        out << t.span.line << ":" << t.span.column << "\t" << tokenTypeToString(t.type);
        if (!t.value.empty()) out << " | " << t.value;
        out << "\n";
    }
}

} // namespace forge
