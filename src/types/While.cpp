#include <types/While.hpp>
#include <renderer.hpp>
#include <errors.hpp>
#include <scope.hpp>


While::While(std::string condition, Position p) : Node(WHILE, p), expr(condition) {}

void While::render(RenderContext* ctx, Scope* scope) {
    int rounds = 0;
    while (ctx -> evaluate(expr, scope, pos).truthyness()) {
        if (rounds == ctx -> options -> loopLimit) {
            throw RenderError(pos, "while loop went round " + std::to_string(rounds) + " times and its condition is still true");
        }
        rounds ++;
        Scope inner(scope);
        renderList(body, ctx, &inner);
    }
}

Node* While::clone(NodePool* pool) {
    While* ret = pool -> make<While>(expr, pos);
    ret -> body = cloneList(body, pool);
    return ret;
}

void While::bodies(std::vector<std::vector<Node*>*>& out) {
    out.push_back(&body);
}

void While::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("While %s\n", expr.c_str());
    pTreeList(body, tabLevel + 1);
}
