#include <types/Comment.hpp>
#include <renderer.hpp>


std::string doctypeLiteral(const std::string& kind) {
    static const char* known[][2] = {
        { "html", "<!DOCTYPE html>" },
        { "xml", "<?xml version=\"1.0\" encoding=\"utf-8\" ?>" },
        { "transitional", "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Transitional//EN\" \"http://www.w3.org/TR/xhtml1/DTD/xhtml1-transitional.dtd\">" },
        { "strict", "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Strict//EN\" \"http://www.w3.org/TR/xhtml1/DTD/xhtml1-strict.dtd\">" },
        { "frameset", "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.0 Frameset//EN\" \"http://www.w3.org/TR/xhtml1/DTD/xhtml1-frameset.dtd\">" },
        { "1.1", "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.1//EN\" \"http://www.w3.org/TR/xhtml11/DTD/xhtml11.dtd\">" },
        { "basic", "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML Basic 1.1//EN\" \"http://www.w3.org/TR/xhtml-basic/xhtml-basic11.dtd\">" },
        { "mobile", "<!DOCTYPE html PUBLIC \"-//WAPFORUM//DTD XHTML Mobile 1.2//EN\" \"http://www.openmobilealliance.org/tech/DTD/xhtml-mobile12.dtd\">" },
        { "plist", "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" \"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">" }
    };
    for (auto& entry : known) {
        if (kind == entry[0]) {
            return entry[1];
        }
    }
    return "<!DOCTYPE " + kind + ">";
}


Comment::Comment(std::string content, bool isVisible, Position p) : Node(COMMENT, p), text(content), visible(isVisible) {}

void Comment::render(RenderContext* ctx, Scope* scope) {
    if (!visible) {
        return;
    }
    ctx -> beginLine();
    ctx -> out -> write("<!--" + text + "-->");
}

Node* Comment::clone(NodePool* pool) {
    return pool -> make<Comment>(text, visible, pos);
}

void Comment::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("%s comment\n", visible ? "Visible" : "Silent");
}


Doctype::Doctype(std::string doctypeKind, Position p) : Node(DOCTYPE, p), kind(doctypeKind) {}

void Doctype::render(RenderContext* ctx, Scope* scope) {
    if (kind == "html") {
        ctx -> terse = true;
    }
    ctx -> beginLine();
    ctx -> out -> write(doctypeLiteral(kind));
}

Node* Doctype::clone(NodePool* pool) {
    return pool -> make<Doctype>(kind, pos);
}

void Doctype::pTree(int tabLevel) {
    pTreeIndent(tabLevel);
    printf("Doctype %s\n", kind.c_str());
}
