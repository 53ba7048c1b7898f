#include <types/Conditional.hpp>
#include <renderer.hpp>


Conditional::Conditional(Position p) : Node(CONDITIONAL, p) {}

void Conditional::render(RenderContext* ctx, Scope* scope) {
    for (Branch& branch : branches) { // first truthy branch wins, later predicates are never evaluated
        if (ctx -> evaluate(branch.expr, scope, branch.pos).truthyness() != branch.negated) {
            renderList(branch.body, ctx, scope);
            return;
        }
    }
    if (hasElse) {
        renderList(elseBody, ctx, scope);
    }
}

Node* Conditional::clone(NodePool* pool) {
    Conditional* ret = pool -> make<Conditional>(pos);
    for (Branch& branch : branches) {
        Branch b = branch;
        b.body = cloneList(branch.body, pool);
        ret -> branches.push_back(b);
    }
    ret -> hasElse = hasElse;
    ret -> elseBody = cloneList(elseBody, pool);
    return ret;
}

void Conditional::bodies(std::vector<std::vector<Node*>*>& out) {
    for (Branch& branch : branches) {
        out.push_back(&branch.body);
    }
    out.push_back(&elseBody);
}

void Conditional::pTree(int tabLevel) {
    for (size_t i = 0; i < branches.size(); i ++) {
        pTreeIndent(tabLevel);
        printf("%s%s %s\n", i == 0 ? "" : "else ", branches[i].negated ? "unless" : "if", branches[i].expr.c_str());
        pTreeList(branches[i].body, tabLevel + 1);
    }
    if (hasElse) {
        pTreeIndent(tabLevel);
        printf("else\n");
        pTreeList(elseBody, tabLevel + 1);
    }
}
