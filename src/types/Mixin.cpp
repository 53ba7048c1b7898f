#include <types/Mixin.hpp>
#include <renderer.hpp>
#include <errors.hpp>
#include <scope.hpp>


MixinDef::MixinDef(std::string mixinName, Position p) : Node(MIXINDEF, p), name(mixinName) {}

void MixinDef::render(RenderContext* ctx, Scope* scope) {}

Node* MixinDef::clone(NodePool* pool) {
    MixinDef* ret = pool -> make<MixinDef>(name, pos);
    ret -> params = params;
    ret -> body = cloneList(body, pool);
    return ret;
}

void MixinDef::bodies(std::vector<std::vector<Node*>*>& out) {
    out.push_back(&body);
}

void MixinDef::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("Mixin definition %s(", name.c_str());
    for (size_t i = 0; i < params.size(); i ++) {
        printf("%s%s%s%s%s", i > 0 ? ", " : "", params[i].rest ? "..." : "", params[i].name.c_str(), params[i].hasDefault ? "=" : "", params[i].defaultExpr.c_str());
    }
    printf(")\n");
    pTreeList(body, tabLevel + 1);
}


MixinCall::MixinCall(std::string mixinName, Position p) : Node(MIXINCALL, p), name(mixinName) {}

void MixinCall::render(RenderContext* ctx, Scope* scope) {
    throw RenderError(pos, "call to mixin '" + name + "' was never expanded");
}

Node* MixinCall::clone(NodePool* pool) {
    MixinCall* ret = pool -> make<MixinCall>(name, pos);
    ret -> args = args;
    ret -> hasBlock = hasBlock;
    ret -> blockContent = cloneList(blockContent, pool);
    return ret;
}

void MixinCall::bodies(std::vector<std::vector<Node*>*>& out) {
    out.push_back(&blockContent);
}

void MixinCall::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("Mixin call +%s(", name.c_str());
    for (size_t i = 0; i < args.size(); i ++) {
        printf("%s%s", i > 0 ? ", " : "", args[i].c_str());
    }
    printf(")%s\n", hasBlock ? " with block" : "");
    pTreeList(blockContent, tabLevel + 1);
}


MixinScope::MixinScope(std::string mixinName, Position p) : Node(MIXINSCOPE, p), name(mixinName) {}

void MixinScope::render(RenderContext* ctx, Scope* scope) {
    Scope inner(ctx -> root); // the mixin body sees globals and its parameters, not the call site's locals
    for (Binding& binding : bindings) {
        if (binding.source == Binding::Argument) {
            inner.set(binding.name, ctx -> evaluate(binding.expr, scope, pos));
        }
        else if (binding.source == Binding::Default) {
            inner.set(binding.name, ctx -> evaluate(binding.expr, &inner, pos));
        }
        else if (binding.source == Binding::Rest) {
            Value list = Value::makeList();
            for (std::string& arg : binding.rest) {
                list.push(ctx -> evaluate(arg, scope, pos));
            }
            inner.set(binding.name, list);
        }
        else {
            inner.set(binding.name, Value());
        }
    }
    auto previous = ctx -> callers.find(this);
    Scope* saved = previous == ctx -> callers.end() ? NULL : previous -> second;
    ctx -> callers[this] = scope;
    renderList(body, ctx, &inner);
    if (saved == NULL) {
        ctx -> callers.erase(this);
    }
    else {
        ctx -> callers[this] = saved;
    }
}

Node* MixinScope::clone(NodePool* pool) {
    MixinScope* ret = pool -> make<MixinScope>(name, pos);
    ret -> bindings = bindings;
    ret -> body = cloneList(body, pool);
    return ret;
}

void MixinScope::bodies(std::vector<std::vector<Node*>*>& out) {
    out.push_back(&body);
}

void MixinScope::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("Mixin scope %s", name.c_str());
    for (Binding& binding : bindings) {
        printf(" [%s]", binding.name.c_str());
    }
    printf("\n");
    pTreeList(body, tabLevel + 1);
}


CallerBlock::CallerBlock(MixinScope* o, std::vector<Node*> content, Position p) : Node(CALLERBLOCK, p), owner(o), body(content) {}

void CallerBlock::render(RenderContext* ctx, Scope* scope) {
    auto caller = ctx -> callers.find(owner);
    if (caller == ctx -> callers.end()) {
        throw RenderError(pos, "block content rendered outside of the mixin call it belongs to");
    }
    renderList(body, ctx, caller -> second);
}

Node* CallerBlock::clone(NodePool* pool) {
    return pool -> make<CallerBlock>(owner, body, pos);
}

void CallerBlock::bodies(std::vector<std::vector<Node*>*>& out) {
    out.push_back(&body);
}

void CallerBlock::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("Caller block for %s\n", owner -> name.c_str());
    pTreeList(body, tabLevel + 1);
}
