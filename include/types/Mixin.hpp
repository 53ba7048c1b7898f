// everything mixin-shaped. MixinDef and MixinCall come out of the parser; the expander turns every call into a MixinScope
// and every bare `block` inside the called body into a CallerBlock.
#pragma once
#include <string>
#include <vector>
#include <node.hpp>


struct Param {
    std::string name;
    std::string defaultExpr;
    bool hasDefault = false;
    bool rest = false; // ...name, collects the leftover arguments into a list
};


struct MixinDef : Node {
    std::string name;
    std::vector<Param> params;
    std::vector<Node*> body;

    MixinDef(std::string mixinName, Position p);

    void render(RenderContext* ctx, Scope* scope); // definitions produce no output

    Node* clone(NodePool* pool);

    void bodies(std::vector<std::vector<Node*>*>& out);

    void pTree(int tabLevel);
};


struct MixinCall : Node {
    std::string name;
    std::vector<std::string> args; // expression sources, positional
    bool hasBlock = false;
    std::vector<Node*> blockContent;

    MixinCall(std::string mixinName, Position p);

    void render(RenderContext* ctx, Scope* scope); // always a RenderError: calls must be expanded first

    Node* clone(NodePool* pool);

    void bodies(std::vector<std::vector<Node*>*>& out);

    void pTree(int tabLevel);
};


struct Binding {
    std::string name;
    enum Source {
        Argument, // evaluated in the caller's scope
        Default, // the parameter's default, evaluated in the mixin's own scope (so it can see earlier parameters)
        Undefined, // no argument and no default: bound to null
        Rest // every leftover argument, evaluated in the caller's scope
    } source = Undefined;
    std::string expr;
    std::vector<std::string> rest;
};


struct MixinScope : Node { // one expanded mixin call
    std::string name;
    std::vector<Binding> bindings;
    std::vector<Node*> body;

    MixinScope(std::string mixinName, Position p);

    void render(RenderContext* ctx, Scope* scope);

    Node* clone(NodePool* pool);

    void bodies(std::vector<std::vector<Node*>*>& out);

    void pTree(int tabLevel);
};


struct CallerBlock : Node { // the call site's block content, spliced into a mixin body
    MixinScope* owner; // the expansion whose caller scope this renders in
    std::vector<Node*> body; // shared with every other CallerBlock for the same call; nodes are read-only by now

    CallerBlock(MixinScope* o, std::vector<Node*> content, Position p);

    void render(RenderContext* ctx, Scope* scope);

    Node* clone(NodePool* pool);

    void bodies(std::vector<std::vector<Node*>*>& out);

    void pTree(int tabLevel);
};
