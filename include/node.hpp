#pragma once
#include <vector>
#include <utility>
#include <defs.h>
#include <position.hpp>


struct Node { // superclass
    enum Type {
        ELEMENT,
        TEXT,
        CONDITIONAL,
        EACH,
        WHILE,
        CASE,
        MIXINDEF,
        MIXINCALL,
        MIXINSCOPE,
        CALLERBLOCK,
        BLOCK,
        EXTENDS,
        INCLUDE,
        COMMENT,
        DOCTYPE,
        CODE
    } type; // the linker and expander switch on this to find the nodes they rewrite

    Position pos;

    Node(Type t, Position p) : type(t), pos(p) {}

    virtual ~Node() = default;

    virtual void render(RenderContext* ctx, Scope* scope) = 0; // true virtual function
    // scope is the innermost variable scope: loop variables and mixin parameters live there, globals at its root

    virtual Node* clone(NodePool* pool) = 0; // deep copy, allocated out of pool

    virtual void bodies(std::vector<std::vector<Node*>*>& out); // every child list this node owns, for the passes that rewrite them

    virtual void pTree(int tabLevel = 0);
};


struct NodePool { // owns every node made during one compile. nodes point at each other freely; nobody else deletes them.
    std::vector<Node*> nodes;

    NodePool() = default;

    NodePool(const NodePool&) = delete;

    NodePool& operator=(const NodePool&) = delete;

    ~NodePool();

    template <typename T, typename... Args>
    T* make(Args&&... args) {
        T* node = new T(std::forward<Args>(args)...);
        nodes.push_back(node);
        return node;
    }
};


std::vector<Node*> cloneList(const std::vector<Node*>& list, NodePool* pool);

void renderList(const std::vector<Node*>& list, RenderContext* ctx, Scope* scope);

void pTreeList(const std::vector<Node*>& list, int tabLevel);

void pTreeIndent(int tabLevel);
