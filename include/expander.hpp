// Expander inlines every mixin call. Definitions are hoisted first, so a mixin can be called above the line that defines it.
#pragma once
#include <map>
#include <string>
#include <vector>
#include <defs.h>
#include <node.hpp>
#include <options.h>
#include <types/Mixin.hpp>


struct Expander {
    NodePool* pool;
    const CompileOptions* options;
    std::map<std::string, MixinDef*> mixins;

    Expander(NodePool* nodePool, const CompileOptions* opts);

    std::vector<Node*> expand(std::vector<Node*> nodes); // throws ExpansionError. no MixinDef or MixinCall survives.

private:
    void hoist(std::vector<Node*>& nodes);

    std::vector<Node*> expandList(const std::vector<Node*>& nodes, int depth, MixinScope* owner, const std::vector<Node*>* callerContent);
    // owner and callerContent belong to the innermost expansion being built: bare `block` markers turn into its CallerBlocks

    MixinScope* expandCall(MixinCall* call, int depth, MixinScope* owner, const std::vector<Node*>* callerContent);
};
