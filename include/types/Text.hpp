#pragma once
#include <string>
#include <vector>
#include <node.hpp>


struct Segment { // one run of a text line: literal bytes, or an interpolated expression
    bool isExpr = false;
    std::string text; // literal text, or expression source
    bool escaped = true; // #{} (true) vs !{} (false); meaningless for literals, which are never escaped
    Position pos;
};


struct Text : Node {
    std::vector<Segment> segments;
    bool escaped = true; // cleared for `!=` echoes and raw included files: nothing in this node gets escaped
    bool piped = false; // came from `| text`; consecutive piped lines merge into one Text

    Text(Position p);

    void append(const Segment& seg); // adjacent literals get glued together

    void appendLiteral(const std::string& literal, Position at);

    void render(RenderContext* ctx, Scope* scope);

    Node* clone(NodePool* pool);

    void pTree(int tabLevel);
};
