#include <types/Each.hpp>
#include <renderer.hpp>
#include <errors.hpp>
#include <scope.hpp>


Each::Each(Position p) : Node(EACH, p) {}

void Each::render(RenderContext* ctx, Scope* scope) {
    Value iterable = ctx -> evaluate(expr, scope, pos); // exactly once
    if (iterable.type == Value::List && iterable.list.size() > 0) {
        for (size_t i = 0; i < iterable.list.size(); i ++) {
            Scope inner(scope);
            inner.set(itemVar, iterable.list[i]);
            if (indexVar.size() > 0) {
                inner.set(indexVar, Value((double)i));
            }
            renderList(body, ctx, &inner);
        }
    }
    else if (iterable.type == Value::Map && iterable.map.size() > 0) { // maps hand out values, the index variable gets the key
        for (auto& entry : iterable.map) {
            Scope inner(scope);
            inner.set(itemVar, entry.second);
            if (indexVar.size() > 0) {
                inner.set(indexVar, Value(entry.first));
            }
            renderList(body, ctx, &inner);
        }
    }
    else if (iterable.type & (Value::List | Value::Map | Value::Null)) { // empty, or nothing at all
        if (hasElse) {
            renderList(elseBody, ctx, scope);
        }
    }
    else {
        throw EvaluationError(pos, std::string("can't iterate over a ") + iterable.typeName(), expr);
    }
}

Node* Each::clone(NodePool* pool) {
    Each* ret = pool -> make<Each>(pos);
    ret -> itemVar = itemVar;
    ret -> indexVar = indexVar;
    ret -> expr = expr;
    ret -> body = cloneList(body, pool);
    ret -> hasElse = hasElse;
    ret -> elseBody = cloneList(elseBody, pool);
    return ret;
}

void Each::bodies(std::vector<std::vector<Node*>*>& out) {
    out.push_back(&body);
    out.push_back(&elseBody);
}

void Each::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("Each %s%s%s in %s\n", itemVar.c_str(), indexVar.size() > 0 ? ", " : "", indexVar.c_str(), expr.c_str());
    pTreeList(body, tabLevel + 1);
    if (hasElse) {
        pTreeIndent(tabLevel);
        printf("else\n");
        pTreeList(elseBody, tabLevel + 1);
    }
}
