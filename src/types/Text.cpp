#include <types/Text.hpp>
#include <renderer.hpp>
#include <util.hpp>


Text::Text(Position p) : Node(TEXT, p) {}

void Text::append(const Segment& seg) {
    if (!seg.isExpr && segments.size() > 0 && !segments.back().isExpr) {
        segments.back().text += seg.text;
        return;
    }
    segments.push_back(seg);
}

void Text::appendLiteral(const std::string& literal, Position at) {
    Segment seg;
    seg.text = literal;
    seg.pos = at;
    append(seg);
}

void Text::render(RenderContext* ctx, Scope* scope) {
    std::string content;
    for (Segment& seg : segments) {
        if (!seg.isExpr) {
            content += seg.text;
        }
        else if (escaped && seg.escaped) {
            content += escapeHtml(ctx -> textOf(seg.text, scope, seg.pos));
        }
        else {
            content += ctx -> textOf(seg.text, scope, seg.pos);
        }
    }
    ctx -> beginLine();
    ctx -> out -> write(content);
}

Node* Text::clone(NodePool* pool) {
    Text* ret = pool -> make<Text>(pos);
    ret -> segments = segments;
    ret -> escaped = escaped;
    ret -> piped = piped;
    return ret;
}

void Text::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("Text with %zu segment(s)%s\n", segments.size(), escaped ? "" : ", unescaped");
    for (Segment& seg : segments) {
        pTreeIndent(tabLevel + 1);
        if (seg.isExpr) {
            printf("%s{%s}\n", seg.escaped ? "#" : "!", seg.text.c_str());
        }
        else {
            printf("\"%s\"\n", seg.text.c_str());
        }
    }
}
