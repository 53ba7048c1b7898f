#pragma once
#include <string>
#include <vector>
#include <node.hpp>


struct Each : Node {
    std::string itemVar;
    std::string indexVar; // empty if the loop didn't ask for one
    std::string expr;
    std::vector<Node*> body;
    bool hasElse = false;
    std::vector<Node*> elseBody; // rendered when the iterable is empty

    Each(Position p);

    void render(RenderContext* ctx, Scope* scope);

    Node* clone(NodePool* pool);

    void bodies(std::vector<std::vector<Node*>*>& out);

    void pTree(int tabLevel);
};
