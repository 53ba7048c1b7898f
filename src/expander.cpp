#include <expander.hpp>
#include <errors.hpp>
#include <types/Block.hpp>


Expander::Expander(NodePool* nodePool, const CompileOptions* opts) : pool(nodePool), options(opts) {}

std::vector<Node*> Expander::expand(std::vector<Node*> nodes) {
    mixins.clear();
    hoist(nodes);
    if (options -> verbose) {
        printf(INFO "Hoisted %zu mixin(s)\n", mixins.size());
    }
    return expandList(nodes, 0, NULL, NULL);
}

void Expander::hoist(std::vector<Node*>& nodes) {
    for (Node* node : nodes) {
        if (node -> type == Node::MIXINDEF) {
            MixinDef* def = (MixinDef*)node;
            if (options -> verbose && mixins.contains(def -> name)) {
                printf(WARNING "mixin %s is defined again at %s; the later definition wins\n", def -> name.c_str(), def -> pos.toString().c_str());
            }
            mixins[def -> name] = def; // a later definition replaces an earlier one
        }
        std::vector<std::vector<Node*>*> bodies;
        node -> bodies(bodies);
        for (auto body : bodies) {
            hoist(*body);
        }
    }
}

std::vector<Node*> Expander::expandList(const std::vector<Node*>& nodes, int depth, MixinScope* owner, const std::vector<Node*>* callerContent) {
    std::vector<Node*> ret;
    for (Node* node : nodes) {
        if (node -> type == Node::MIXINDEF) {
            continue;
        }
        if (node -> type == Node::MIXINCALL) {
            ret.push_back(expandCall((MixinCall*)node, depth, owner, callerContent));
            continue;
        }
        if (node -> type == Node::BLOCK && ((Block*)node) -> name.size() == 0) { // bare `block`: whatever the call site passed in, or nothing
            if (owner != NULL && callerContent != NULL) {
                ret.push_back(pool -> make<CallerBlock>(owner, *callerContent, node -> pos));
            }
            continue;
        }
        std::vector<std::vector<Node*>*> bodies;
        node -> bodies(bodies);
        for (auto body : bodies) {
            *body = expandList(*body, depth, owner, callerContent);
        }
        ret.push_back(node);
    }
    return ret;
}

MixinScope* Expander::expandCall(MixinCall* call, int depth, MixinScope* owner, const std::vector<Node*>* callerContent) {
    if (depth >= options -> mixinDepthLimit) {
        throw ExpansionError(ExpansionError::RecursionLimit, call -> pos, "mixin calls nest more than " + std::to_string(options -> mixinDepthLimit) + " deep (is +" + call -> name + " recursive?)");
    }
    auto found = mixins.find(call -> name);
    if (found == mixins.end()) {
        throw ExpansionError(ExpansionError::UnknownMixin, call -> pos, "no mixin named '" + call -> name + "'");
    }
    MixinDef* def = found -> second;
    std::vector<Node*> content = expandList(call -> blockContent, depth, owner, callerContent); // call-site content belongs to the caller's expansion

    MixinScope* scope = pool -> make<MixinScope>(call -> name, call -> pos);
    for (size_t i = 0; i < def -> params.size(); i ++) {
        Param& param = def -> params[i];
        Binding binding;
        binding.name = param.name;
        if (param.rest) {
            binding.source = Binding::Rest;
            for (size_t a = i; a < call -> args.size(); a ++) {
                binding.rest.push_back(call -> args[a]);
            }
        }
        else if (i < call -> args.size()) {
            binding.source = Binding::Argument;
            binding.expr = call -> args[i];
        }
        else if (param.hasDefault) {
            binding.source = Binding::Default;
            binding.expr = param.defaultExpr;
        }
        else {
            binding.source = Binding::Undefined;
        }
        scope -> bindings.push_back(binding);
    }
    scope -> body = expandList(cloneList(def -> body, pool), depth + 1, scope, call -> hasBlock ? &content : NULL);
    return scope;
}
