#pragma once
#include <string>
#include <vector>
#include <node.hpp>


struct Branch {
    std::string expr;
    bool negated = false; // `unless`
    std::vector<Node*> body;
    Position pos;
};


struct Conditional : Node { // if / else if / else (and unless), one node per chain
    std::vector<Branch> branches;
    bool hasElse = false;
    std::vector<Node*> elseBody;

    Conditional(Position p);

    void render(RenderContext* ctx, Scope* scope);

    Node* clone(NodePool* pool);

    void bodies(std::vector<std::vector<Node*>*>& out);

    void pTree(int tabLevel);
};
