#pragma once
#include <string>
#include <vector>
#include <node.hpp>
#include <types/Text.hpp>


struct Attribute {
    std::string name;
    std::string expr; // expression source for name=expr
    bool boolean = false; // bare `name`, which is always true
    bool escaped = true; // name=expr (true) vs name!=expr (false)
    bool interpolated = false; // a quoted literal with #{} spans in it; the value is built from segments instead of expr
    std::vector<Segment> segments;
    Position pos;
};


struct Element : Node {
    std::string name;
    std::vector<std::string> classes; // shorthand classes, first-seen order, no duplicates
    std::string id; // #id shorthand, empty if there wasn't one
    std::vector<Attribute> attributes; // source order
    std::vector<Node*> children;
    bool selfClosing = false; // explicit trailing /

    Element(std::string tagName, Position p);

    void addClass(const std::string& cls);

    void render(RenderContext* ctx, Scope* scope);

    Node* clone(NodePool* pool);

    void bodies(std::vector<std::vector<Node*>*>& out);

    void pTree(int tabLevel);
};


bool isVoidElement(const std::string& name);
