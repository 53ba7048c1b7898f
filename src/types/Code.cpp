#include <types/Code.hpp>
#include <renderer.hpp>
#include <scope.hpp>


Code::Code(std::string variable, std::string expression, Position p) : Node(CODE, p), name(variable), expr(expression) {}

void Code::render(RenderContext* ctx, Scope* scope) {
    scope -> assign(name, ctx -> evaluate(expr, scope, pos));
}

Node* Code::clone(NodePool* pool) {
    return pool -> make<Code>(name, expr, pos);
}

void Code::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("Code %s = %s\n", name.c_str(), expr.c_str());
}
