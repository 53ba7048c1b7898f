#pragma once
#include <string>
#include <vector>
#include <node.hpp>


struct While : Node { // re-evaluates expr before every pass; only `- name = ...` lines in the body can make it go false
    std::string expr;
    std::vector<Node*> body;

    While(std::string condition, Position p);

    void render(RenderContext* ctx, Scope* scope);

    Node* clone(NodePool* pool);

    void bodies(std::vector<std::vector<Node*>*>& out);

    void pTree(int tabLevel);
};
