#pragma once
#include <string>
#include <node.hpp>


struct Comment : Node {
    std::string text; // everything after the // (and any deeper lines, newline-joined)
    bool visible = true; // `//` renders, `//-` doesn't

    Comment(std::string content, bool isVisible, Position p);

    void render(RenderContext* ctx, Scope* scope);

    Node* clone(NodePool* pool);

    void pTree(int tabLevel);
};


struct Doctype : Node {
    std::string kind;

    Doctype(std::string doctypeKind, Position p);

    void render(RenderContext* ctx, Scope* scope);

    Node* clone(NodePool* pool);

    void pTree(int tabLevel);
};


std::string doctypeLiteral(const std::string& kind);
