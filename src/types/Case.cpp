#include <types/Case.hpp>
#include <renderer.hpp>


Case::Case(Position p) : Node(CASE, p) {}

void Case::render(RenderContext* ctx, Scope* scope) {
    Value v = ctx -> evaluate(subject, scope, pos);
    bool matched = false;
    for (When& when : whens) {
        if (!matched) {
            for (std::string& candidate : when.values) {
                if (ctx -> evaluate(candidate, scope, when.pos).equals(v)) {
                    matched = true;
                    break;
                }
            }
        }
        if (matched && when.body.size() > 0) {
            renderList(when.body, ctx, scope);
            return;
        }
    }
    if (hasDefault) { // reached when nothing matched, or a matching when fell through past the last one
        renderList(defaultBody, ctx, scope);
    }
}

Node* Case::clone(NodePool* pool) {
    Case* ret = pool -> make<Case>(pos);
    ret -> subject = subject;
    for (When& when : whens) {
        When w = when;
        w.body = cloneList(when.body, pool);
        ret -> whens.push_back(w);
    }
    ret -> hasDefault = hasDefault;
    ret -> defaultBody = cloneList(defaultBody, pool);
    return ret;
}

void Case::bodies(std::vector<std::vector<Node*>*>& out) {
    for (When& when : whens) {
        out.push_back(&when.body);
    }
    out.push_back(&defaultBody);
}

void Case::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("Case %s\n", subject.c_str());
    for (When& when : whens) {
        pTreeIndent(tabLevel + 1);
        printf("when");
        for (std::string& value : when.values) {
            printf(" %s", value.c_str());
        }
        printf("\n");
        pTreeList(when.body, tabLevel + 2);
    }
    if (hasDefault) {
        pTreeIndent(tabLevel + 1);
        printf("default\n");
        pTreeList(defaultBody, tabLevel + 2);
    }
}
