#include <types/Element.hpp>
#include <renderer.hpp>
#include <errors.hpp>
#include <util.hpp>


static const char* voidElements[] = { "area", "base", "br", "col", "embed", "hr", "img", "input", "link", "meta", "param", "source", "track", "wbr" };

bool isVoidElement(const std::string& name) {
    for (const char* v : voidElements) {
        if (name == v) {
            return true;
        }
    }
    return false;
}


static void addUnique(std::vector<std::string>& list, const std::string& item) {
    if (item.size() == 0) {
        return;
    }
    for (auto& existing : list) {
        if (existing == item) {
            return;
        }
    }
    list.push_back(item);
}

static void mergeClasses(std::vector<std::string>& classes, const Value& v, const Position& at) { // dynamic class values: "a b", ["a", "b"] or {a: true, b: false}
    if (v.type == Value::String) {
        size_t i = 0;
        while (i < v.string.size()) {
            while (i < v.string.size() && isWhitespace(v.string[i])) {
                i ++;
            }
            size_t start = i;
            while (i < v.string.size() && !isWhitespace(v.string[i])) {
                i ++;
            }
            addUnique(classes, v.string.substr(start, i - start));
        }
    }
    else if (v.type == Value::List) {
        for (const Value& item : v.list) {
            if (item.type & (Value::List | Value::Map)) {
                throw EvaluationError(at, std::string("class lists can't contain a ") + item.typeName());
            }
            std::string name;
            item.stringify(name);
            addUnique(classes, name);
        }
    }
    else if (v.type == Value::Map) {
        for (auto& entry : v.map) {
            if (entry.second.truthyness()) {
                addUnique(classes, entry.first);
            }
        }
    }
    else if (v.type == Value::Number) {
        addUnique(classes, numberToString(v.number));
    }
    // null and booleans add nothing
}


Element::Element(std::string tagName, Position p) : Node(ELEMENT, p), name(tagName) {}

void Element::addClass(const std::string& cls) {
    addUnique(classes, cls);
}

void Element::render(RenderContext* ctx, Scope* scope) {
    bool isVoid = isVoidElement(name);
    if ((isVoid || selfClosing) && children.size() > 0) {
        throw RenderError(pos, "<" + name + "> is " + (isVoid ? "a void element" : "self-closing") + " and can't have children");
    }
    std::vector<std::string> allClasses = classes;
    std::string idValue = id;
    std::vector<std::pair<std::string, std::string>> rendered; // name, already-escaped value; a bare name has no value
    std::vector<bool> bare;
    for (Attribute& attr : attributes) {
        Value v;
        if (attr.boolean) {
            v = Value(true);
        }
        else if (attr.interpolated) {
            std::string built;
            for (Segment& seg : attr.segments) {
                built += seg.isExpr ? ctx -> textOf(seg.text, scope, seg.pos) : seg.text;
            }
            v = Value(built);
        }
        else {
            v = ctx -> evaluate(attr.expr, scope, attr.pos);
        }
        if (attr.name == "class") {
            mergeClasses(allClasses, v, attr.pos);
            continue;
        }
        if (attr.name == "id") { // an explicit id wins over #id
            std::string s;
            if (v.type & (Value::Null | Value::Boolean)) {
                if (!v.truthyness()) {
                    idValue = "";
                }
                continue;
            }
            if (!v.stringify(s)) {
                throw EvaluationError(attr.pos, std::string("id can't be a ") + v.typeName(), attr.expr);
            }
            idValue = s;
            continue;
        }
        if (v.type == Value::Null || (v.type == Value::Boolean && !v.boolean)) {
            continue; // false and null leave the attribute out entirely
        }
        std::string text;
        bool isBare = false;
        if (v.type == Value::Boolean) {
            isBare = true;
        }
        else if (v.type == Value::Map && attr.name == "style") {
            for (auto& entry : v.map) {
                std::string part;
                if (!entry.second.stringify(part)) {
                    throw EvaluationError(attr.pos, "style values can't be a " + std::string(entry.second.typeName()), attr.expr);
                }
                text += entry.first + ":" + part + ";";
            }
        }
        else if (!v.stringify(text)) {
            throw EvaluationError(attr.pos, "attribute " + attr.name + " can't be a " + v.typeName(), attr.expr);
        }
        if (attr.escaped) {
            text = escapeHtml(text);
        }
        bool replaced = false;
        for (size_t i = 0; i < rendered.size(); i ++) { // a repeated attribute keeps its first position and its last value
            if (rendered[i].first == attr.name) {
                rendered[i].second = text;
                bare[i] = isBare;
                replaced = true;
            }
        }
        if (!replaced) {
            rendered.push_back({ attr.name, text });
            bare.push_back(isBare);
        }
    }

    ctx -> beginLine();
    std::string open = "<" + name;
    if (allClasses.size() > 0) {
        open += " class=\"";
        for (size_t i = 0; i < allClasses.size(); i ++) {
            if (i > 0) {
                open += " ";
            }
            open += escapeHtml(allClasses[i]);
        }
        open += "\"";
    }
    if (idValue.size() > 0) {
        open += " id=\"" + escapeHtml(idValue) + "\"";
    }
    for (size_t i = 0; i < rendered.size(); i ++) {
        open += " " + rendered[i].first;
        if (!bare[i]) {
            open += "=\"" + rendered[i].second + "\"";
        }
    }
    ctx -> out -> write(open);
    if (isVoid || selfClosing) {
        ctx -> out -> write(ctx -> terse && !selfClosing ? ">" : "/>");
        return;
    }
    ctx -> out -> write(">");
    bool textOnly = true; // elements with nothing but text in them stay on one line
    for (Node* child : children) {
        if (child -> type != TEXT && child -> type != CODE) {
            textOnly = false;
        }
    }
    if (textOnly || ctx -> inlineText) {
        bool wasInline = ctx -> inlineText;
        ctx -> inlineText = true;
        renderList(children, ctx, scope);
        ctx -> inlineText = wasInline;
    }
    else {
        ctx -> depth ++;
        renderList(children, ctx, scope);
        ctx -> depth --;
        ctx -> beginLine();
    }
    ctx -> out -> write("</" + name + ">");
}

Node* Element::clone(NodePool* pool) {
    Element* ret = pool -> make<Element>(name, pos);
    ret -> classes = classes;
    ret -> id = id;
    ret -> attributes = attributes;
    ret -> selfClosing = selfClosing;
    ret -> children = cloneList(children, pool);
    return ret;
}

void Element::bodies(std::vector<std::vector<Node*>*>& out) {
    out.push_back(&children);
}

void Element::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("Element <%s>", name.c_str());
    for (auto& cls : classes) {
        printf(" .%s", cls.c_str());
    }
    if (id.size() > 0) {
        printf(" #%s", id.c_str());
    }
    for (auto& attr : attributes) {
        printf(" %s%s%s", attr.name.c_str(), attr.boolean ? "" : (attr.escaped ? "=" : "!="), attr.expr.c_str());
    }
    printf(selfClosing ? " (self-closing)\n" : "\n");
    pTreeList(children, tabLevel + 1);
}
