#pragma once
#include <string>
#include <node.hpp>


struct Code : Node { // `- name = expr`: writes nothing, rebinds a variable for whatever renders after it
    std::string name;
    std::string expr;

    Code(std::string variable, std::string expression, Position p);

    void render(RenderContext* ctx, Scope* scope);

    Node* clone(NodePool* pool);

    void pTree(int tabLevel);
};
