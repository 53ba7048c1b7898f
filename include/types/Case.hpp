#pragma once
#include <string>
#include <vector>
#include <node.hpp>


struct When {
    std::vector<std::string> values;
    std::vector<Node*> body; // an empty body falls through to the next when
    Position pos;
};


struct Case : Node {
    std::string subject;
    std::vector<When> whens;
    bool hasDefault = false;
    std::vector<Node*> defaultBody;

    Case(Position p);

    void render(RenderContext* ctx, Scope* scope);

    Node* clone(NodePool* pool);

    void bodies(std::vector<std::vector<Node*>*>& out);

    void pTree(int tabLevel);
};
